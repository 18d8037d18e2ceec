#include "Viewer/GLRenderDevice.hpp"
#include <GL/glew.h>
#include <glm/gtc/type_ptr.hpp>
#include <plog/Log.h>
#include <cstring>
#include <vector>

namespace CadPreview {

static GLuint compileShader(GLenum type, const char* src, std::string* outError){
    GLuint s = glCreateShader(type);
    glShaderSource(s,1,&src,nullptr);
    glCompileShader(s);
    GLint ok=0; glGetShaderiv(s,GL_COMPILE_STATUS,&ok);
    if(!ok){ char buf[1024]; glGetShaderInfoLog(s,1024,nullptr,buf); PLOGE << "Shader compile error: " << buf; if(outError) *outError = buf; glDeleteShader(s); return 0; }
    return s;
}

static GLuint linkProgram(GLuint vs, GLuint fs, std::string* outError){
    GLuint p = glCreateProgram(); glAttachShader(p,vs); glAttachShader(p,fs); glLinkProgram(p);
    GLint ok=0; glGetProgramiv(p,GL_LINK_STATUS,&ok);
    if(!ok){ char buf[1024]; glGetProgramInfoLog(p,1024,nullptr,buf); PLOGE << "Program link error: " << buf; if(outError) *outError = buf; glDeleteProgram(p); return 0; }
    return p;
}

static const char* vs_src = R"(
#version 330 core
layout(location=0) in vec3 in_pos;
layout(location=1) in vec3 in_normal;
uniform mat4 uMVP;
uniform mat4 uModel;
uniform mat3 uNormal;
out vec3 vNormal;
out vec3 vWorldPos;
void main(){ vNormal = normalize(uNormal * in_normal); vWorldPos = vec3(uModel * vec4(in_pos,1.0)); gl_Position = uMVP * vec4(in_pos,1.0); }
)";

// ambient + key + rim directional lights, crude roughness-driven specular
static const char* fs_src = R"(
#version 330 core
in vec3 vNormal; in vec3 vWorldPos; out vec4 out_color;
uniform vec3 uColor; uniform float uMetalness; uniform float uRoughness;
uniform vec3 uCameraPos;
uniform vec3 uAmbient;
uniform vec3 uKeyDir; uniform vec3 uKeyColor;
uniform vec3 uRimDir; uniform vec3 uRimColor;
vec3 shade(vec3 N, vec3 V, vec3 L, vec3 lightColor, vec3 baseColor){
    float NdotL = max(dot(N,L), 0.0);
    vec3 F0 = mix(vec3(0.04), baseColor, uMetalness);
    float expo = mix(1.0, 128.0, 1.0 - clamp(uRoughness, 0.0, 1.0));
    float spec = pow(max(dot(reflect(-L, N), V), 0.0), expo);
    return lightColor * (baseColor * (1.0 - uMetalness) * NdotL + F0 * spec);
}
void main(){
    vec3 N = normalize(vNormal);
    vec3 V = normalize(uCameraPos - vWorldPos);
    if(dot(N, V) < 0.0) N = -N;
    vec3 col = uAmbient * uColor;
    col += shade(N, V, normalize(uKeyDir), uKeyColor, uColor);
    col += shade(N, V, normalize(uRimDir), uRimColor, uColor);
    out_color = vec4(col, 1.0);
}
)";

GLRenderDevice::~GLRenderDevice(){ dispose(); }

bool GLRenderDevice::isAccelerationAvailable() const {
    if(!GLEW_VERSION_3_3) return false;
    const GLubyte* renderer = glGetString(GL_RENDERER);
    if(!renderer) return false;
    const char* r = reinterpret_cast<const char*>(renderer);
    // software rasterizers are treated as no acceleration
    if(std::strstr(r, "llvmpipe") || std::strstr(r, "softpipe") || std::strstr(r, "Software Rasterizer")) return false;
    return true;
}

bool GLRenderDevice::initialize(int width, int height, std::string* outError){
    if(initialized_){ resize(width, height); return true; }
    PLOGV << "gl:initialize " << width << "x" << height;
    GLuint vs = compileShader(GL_VERTEX_SHADER, vs_src, outError);
    GLuint fs = compileShader(GL_FRAGMENT_SHADER, fs_src, outError);
    if(vs && fs) prog_ = linkProgram(vs, fs, outError);
    if(vs) glDeleteShader(vs);
    if(fs) glDeleteShader(fs);
    if(!prog_) return false;
    ensureFBOSize(width, height);
    if(!fbo_){
        if(outError) *outError = "framebuffer creation failed";
        return false;
    }
    initialized_ = true;
    return true;
}

void GLRenderDevice::ensureFBOSize(int w, int h){
    if(w<=0||h<=0) return;
    if(fbW_==w && fbH_==h && fbo_) return;
    if(fbo_==0) glGenFramebuffers(1,&fbo_);
    if(fboTex_==0) glGenTextures(1,&fboTex_);
    if(rbo_==0) glGenRenderbuffers(1,&rbo_);
    fbW_=w; fbH_=h;
    glBindTexture(GL_TEXTURE_2D,fboTex_);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D,0,GL_RGBA8,w,h,0,GL_RGBA,GL_UNSIGNED_BYTE,nullptr);
    glBindRenderbuffer(GL_RENDERBUFFER,rbo_);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8, w, h);
    glBindFramebuffer(GL_FRAMEBUFFER,fbo_);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, fboTex_, 0);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, rbo_);
    GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    if(status != GL_FRAMEBUFFER_COMPLETE) PLOGW << "GLRenderDevice FBO incomplete status=0x" << std::hex << status;
    glBindFramebuffer(GL_FRAMEBUFFER,0);
}

void GLRenderDevice::resize(int width, int height){ ensureFBOSize(width, height); }

uint64_t GLRenderDevice::uploadGeometry(const Geometry& geometry){
    if(geometry.positions.empty() || geometry.indices.empty()) return 0;
    const bool hasNormals = geometry.normals.size() == geometry.positions.size();
    std::vector<float> vbuf;
    vbuf.reserve(geometry.positions.size() * 6);
    for(size_t i=0;i<geometry.positions.size();++i){
        const glm::vec3& p = geometry.positions[i];
        glm::vec3 n = hasNormals ? geometry.normals[i] : glm::vec3(0.0f, 0.0f, 1.0f);
        vbuf.push_back(p.x); vbuf.push_back(p.y); vbuf.push_back(p.z);
        vbuf.push_back(n.x); vbuf.push_back(n.y); vbuf.push_back(n.z);
    }

    GpuGeometry g;
    glGenVertexArrays(1, &g.vao);
    glGenBuffers(1, &g.vbo);
    glGenBuffers(1, &g.ibo);
    glBindVertexArray(g.vao);
    glBindBuffer(GL_ARRAY_BUFFER, g.vbo);
    glBufferData(GL_ARRAY_BUFFER, vbuf.size()*sizeof(float), vbuf.data(), GL_STATIC_DRAW);
    glEnableVertexAttribArray(0); glVertexAttribPointer(0,3,GL_FLOAT,GL_FALSE,6*sizeof(float),(void*)(0));
    glEnableVertexAttribArray(1); glVertexAttribPointer(1,3,GL_FLOAT,GL_FALSE,6*sizeof(float),(void*)(3*sizeof(float)));
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, g.ibo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, geometry.indices.size()*sizeof(uint32_t), geometry.indices.data(), GL_STATIC_DRAW);
    glBindVertexArray(0);
    g.indexCount = static_cast<int>(geometry.indices.size());

    GLenum err = glGetError();
    if(err != GL_NO_ERROR){
        PLOGW << "gl:uploadGeometry glError=0x" << std::hex << err;
        glDeleteBuffers(1,&g.vbo); glDeleteBuffers(1,&g.ibo); glDeleteVertexArrays(1,&g.vao);
        return 0;
    }
    uint64_t handle = nextHandle_++;
    geometries_[handle] = g;
    PLOGV << "gl:uploadGeometry handle=" << handle << " indices=" << g.indexCount;
    return handle;
}

void GLRenderDevice::releaseGeometry(uint64_t handle){
    auto it = geometries_.find(handle);
    if(it == geometries_.end()){ PLOGW << "gl:releaseGeometry unknown handle " << handle; return; }
    GpuGeometry& g = it->second;
    if(g.vbo) glDeleteBuffers(1,&g.vbo);
    if(g.ibo) glDeleteBuffers(1,&g.ibo);
    if(g.vao) glDeleteVertexArrays(1,&g.vao);
    geometries_.erase(it);
}

uint64_t GLRenderDevice::createMaterial(const Material& material){
    GpuMaterial m;
    m.r = material.color.r; m.g = material.color.g; m.b = material.color.b;
    m.metalness = material.metalness;
    m.roughness = material.roughness;
    uint64_t handle = nextHandle_++;
    materials_[handle] = m;
    return handle;
}

void GLRenderDevice::releaseMaterial(uint64_t handle){
    if(materials_.erase(handle) == 0) PLOGW << "gl:releaseMaterial unknown handle " << handle;
}

void GLRenderDevice::render(const SceneNode& root, const PerspectiveCamera& camera, const LightRig& lights){
    if(!initialized_ || !fbo_) return;
    glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
    glViewport(0,0,fbW_,fbH_);
    glEnable(GL_DEPTH_TEST);
    glClearColor(lights.clearColor.r, lights.clearColor.g, lights.clearColor.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    const glm::mat4 view = camera.viewMatrix();
    const glm::mat4 proj = camera.projectionMatrix();

    glUseProgram(prog_);
    auto set3 = [this](const char* name, const glm::vec3& v){ GLint loc = glGetUniformLocation(prog_, name); if(loc>=0) glUniform3f(loc, v.x, v.y, v.z); };
    set3("uCameraPos", camera.position);
    set3("uAmbient", lights.ambient.color * lights.ambient.intensity);
    set3("uKeyDir", lights.key.position);
    set3("uKeyColor", lights.key.color * lights.key.intensity);
    set3("uRimDir", lights.rim.position);
    set3("uRimColor", lights.rim.color * lights.rim.intensity);

    root.traverseConst([&](const SceneNode& node){
        if(node.meshes.empty()) return;
        const glm::mat4& model = node.worldMatrix();
        const glm::mat4 mvp = proj * view * model;
        const glm::mat3 normalMat = glm::transpose(glm::inverse(glm::mat3(model)));
        GLint loc = glGetUniformLocation(prog_, "uMVP"); if(loc>=0) glUniformMatrix4fv(loc,1,GL_FALSE,glm::value_ptr(mvp));
        loc = glGetUniformLocation(prog_, "uModel"); if(loc>=0) glUniformMatrix4fv(loc,1,GL_FALSE,glm::value_ptr(model));
        loc = glGetUniformLocation(prog_, "uNormal"); if(loc>=0) glUniformMatrix3fv(loc,1,GL_FALSE,glm::value_ptr(normalMat));
        for(const auto& mesh : node.meshes){
            if(!mesh.geometry) continue;
            auto git = geometries_.find(mesh.geometry->gpuHandle);
            if(git == geometries_.end()) continue;
            GpuMaterial mat;
            if(mesh.material){
                auto mit = materials_.find(mesh.material->gpuHandle);
                if(mit != materials_.end()) mat = mit->second;
            }
            loc = glGetUniformLocation(prog_, "uColor"); if(loc>=0) glUniform3f(loc, mat.r, mat.g, mat.b);
            loc = glGetUniformLocation(prog_, "uMetalness"); if(loc>=0) glUniform1f(loc, mat.metalness);
            loc = glGetUniformLocation(prog_, "uRoughness"); if(loc>=0) glUniform1f(loc, mat.roughness);
            glBindVertexArray(git->second.vao);
            glDrawElements(GL_TRIANGLES, git->second.indexCount, GL_UNSIGNED_INT, 0);
        }
    });
    glBindVertexArray(0);
    glUseProgram(0);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);

    GLenum err = glGetError();
    if(err != GL_NO_ERROR) PLOGW << "gl:render glError=0x" << std::hex << err;
}

void GLRenderDevice::dispose(){
    if(!geometries_.empty()) PLOGW << "gl:dispose with " << geometries_.size() << " geometries still live";
    for(auto& kv : geometries_){
        GpuGeometry& g = kv.second;
        if(g.vbo) glDeleteBuffers(1,&g.vbo);
        if(g.ibo) glDeleteBuffers(1,&g.ibo);
        if(g.vao) glDeleteVertexArrays(1,&g.vao);
    }
    geometries_.clear();
    materials_.clear();
    if(prog_){ glDeleteProgram(prog_); prog_ = 0; }
    if(fbo_){ glDeleteFramebuffers(1,&fbo_); fbo_ = 0; }
    if(fboTex_){ glDeleteTextures(1,&fboTex_); fboTex_ = 0; }
    if(rbo_){ glDeleteRenderbuffers(1,&rbo_); rbo_ = 0; }
    fbW_ = fbH_ = 0;
    initialized_ = false;
}

} // namespace CadPreview
