#include <iostream>
#include <stdio.h>
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#define IMGUI_IMPL_OPENGL_LOADER_GLEW
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <memory>
#include <cstring>
#include <chrono>
#include <fstream>
#include <future>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "PreviewConfig.hpp"
#include "stringUtils.hpp"
#include "Viewer/ModelViewer.hpp"
#include "Viewer/ModelLoader.hpp"
#include "Viewer/PreviewFetcher.hpp"
#include "Viewer/GLRenderDevice.hpp"
#include "Viewer/ViewerPanel.hpp"

using namespace CadPreview;

static void glfw_error_callback(int error, const char* description)
{
    fprintf(stderr, "Glfw Error %d: %s\n", error, description);
}

static void usage(const char* argv0){
    std::cerr << "usage: " << argv0 << " [--config path.json] [--user id] (--url previewUrl [--kind stl|obj|glb|step] [--download url] | --quote quoteId)\n";
}

// One row of the gateway's /quote-files answer.
struct CatalogRow {
    std::string label;
    std::string fileName;
    std::string previewUrl;
    std::string downloadUrl;
    std::string cadKind;
    std::string fallbackMessage;
};

static std::string absoluteUrl(const std::string& gatewayUrl, const std::string& url){
    if(url.empty() || startsWith(url, "http://") || startsWith(url, "https://")) return url;
    std::string base = gatewayUrl;
    while(!base.empty() && base.back() == '/') base.pop_back();
    return base + (startsWith(url, "/") ? "" : "/") + url;
}

static std::string stringOr(const nlohmann::json& j, const char* key){
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

static std::vector<CatalogRow> fetchCatalog(const std::string& gatewayUrl, const std::string& quoteId, const std::string& userHeader){
    std::vector<CatalogRow> rows;
    CurlPreviewFetcher fetcher(30);
    if(!userHeader.empty()) fetcher.setDefaultHeaders({ userHeader });
    std::string url = absoluteUrl(gatewayUrl, "/quote-files?quoteId=" + urlEncode(quoteId));
    FetchResponse resp = fetcher.fetch(url, 0, [](){ return false; });
    if(!resp.ok()){
        PLOGE << "catalog: GET " << url << " failed status=" << resp.status << " " << resp.transportError;
        return rows;
    }
    nlohmann::json j = nlohmann::json::parse(resp.bodyText(), nullptr, false);
    if(!j.is_object() || !j.contains("files") || !j["files"].is_array()){
        PLOGE << "catalog: unexpected response body";
        return rows;
    }
    for(const auto& f : j["files"]){
        CatalogRow r;
        r.label = stringOr(f, "label");
        r.fileName = stringOr(f, "fileName");
        r.previewUrl = absoluteUrl(gatewayUrl, stringOr(f, "previewUrl"));
        r.downloadUrl = absoluteUrl(gatewayUrl, stringOr(f, "downloadUrl"));
        r.cadKind = stringOr(f, "cadKind");
        r.fallbackMessage = stringOr(f, "fallbackMessage");
        rows.push_back(std::move(r));
    }
    PLOGI << "catalog: " << rows.size() << " file(s) for quote " << quoteId;
    return rows;
}

// Saves the original file next to the working directory.
static void downloadToDisk(const std::string& url, const std::string& fileName, const std::string& userHeader){
    std::thread([url, fileName, userHeader](){
        CurlPreviewFetcher fetcher(300);
        if(!userHeader.empty()) fetcher.setDefaultHeaders({ userHeader });
        FetchResponse resp = fetcher.fetch(url, 0, [](){ return false; });
        if(!resp.ok()){ PLOGE << "download failed status=" << resp.status << " " << resp.transportError; return; }
        std::string name = lastPathSegment(fileName.empty() ? parseFilenameFromContentDisposition(resp.header("content-disposition")) : fileName);
        if(name.empty() || name == "." || name == "..") name = "download.bin";
        std::ofstream out(name, std::ios::binary);
        if(!out){ PLOGE << "download: cannot write " << name; return; }
        out.write(reinterpret_cast<const char*>(resp.body.data()), static_cast<std::streamsize>(resp.body.size()));
        PLOGI << "download: saved " << resp.body.size() << " bytes to " << name;
    }).detach();
}

int main(int argc, char** argv)
{
    std::string configPath, url, kindToken, downloadUrl, quoteId, userId;
    for(int i = 1; i < argc; ++i){
        auto next = [&](std::string& dst){ if(i + 1 < argc){ dst = argv[++i]; return true; } return false; };
        bool ok = true;
        if(std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) ok = next(configPath);
        else if(std::strcmp(argv[i], "--url") == 0) ok = next(url);
        else if(std::strcmp(argv[i], "--kind") == 0) ok = next(kindToken);
        else if(std::strcmp(argv[i], "--download") == 0) ok = next(downloadUrl);
        else if(std::strcmp(argv[i], "--quote") == 0) ok = next(quoteId);
        else if(std::strcmp(argv[i], "--user") == 0) ok = next(userId);
        else if(std::strcmp(argv[i], "--help") == 0){ usage(argv[0]); return 0; }
        else ok = false;
        if(!ok){ usage(argv[0]); return 2; }
    }

    PreviewConfig config;
    std::string err;
    if(!configPath.empty() && !PreviewConfig::loadFromFile(configPath, config, &err)){
        std::cerr << err << "\n";
        return 1;
    }
    config.applyEnvironment();

    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::severityFromString(config.log.level.c_str()), &consoleAppender);
    static std::unique_ptr<plog::RollingFileAppender<plog::TxtFormatter>> fileAppender;
    if(!config.log.file.empty()){
        fileAppender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(config.log.file.c_str(), 5 * 1024 * 1024, 3);
        plog::get()->addAppender(fileAppender.get());
    }
    PLOGI << "plog initialized (" << config.log.level << " -> stderr)";

    const std::string userHeader = userId.empty() ? std::string() : config.server.userHeader + ": " + userId;

    // Setup window
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
        return 1;

    // GL 3.3 + core profile
    const char* glsl_version = "#version 330";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "CAD Preview", nullptr, nullptr);
    if (window == nullptr)
        return 1;
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    if (glewInit() != GLEW_OK) {
        PLOGE << "Failed to initialize GLEW";
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO(); (void)io;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    {
        auto fetcher = std::make_shared<CurlPreviewFetcher>(120);
        if(!userHeader.empty()) fetcher->setDefaultHeaders({ userHeader });
        auto device = std::make_shared<GLRenderDevice>();
        ViewerOptions options;
        options.maxRenderBytes = config.viewer.maxRenderBytes;
        options.fit.paddingFactor = config.viewer.paddingFactor;
        ModelViewer viewer(fetcher, std::make_shared<ModelLoader>(), device, options);
        ViewerPanel panel(viewer, *device);
        panel.setDownloadHandler([&userHeader](const std::string& dl, const std::string& name){ downloadToDisk(dl, name, userHeader); });

        std::vector<CatalogRow> rows;
        std::future<std::vector<CatalogRow>> pendingRows;
        int selected = -1;
        if(!quoteId.empty()){
            pendingRows = std::async(std::launch::async, fetchCatalog, config.viewer.gatewayUrl, quoteId, userHeader);
        } else if(!url.empty()){
            ViewerSource src;
            src.url = absoluteUrl(config.viewer.gatewayUrl, url);
            src.downloadUrl = absoluteUrl(config.viewer.gatewayUrl, downloadUrl);
            src.kind = parseCadKind(kindToken);
            viewer.setSource(src);
        } else {
            PLOGW << "nothing to show: pass --url or --quote";
        }

        while (!glfwWindowShouldClose(window))
        {
            glfwPollEvents();
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            if(pendingRows.valid() && pendingRows.wait_for(std::chrono::seconds(0)) == std::future_status::ready){
                rows = pendingRows.get();
            }

            const ImGuiViewport* vp = ImGui::GetMainViewport();
            if(!quoteId.empty()){
                ImGui::SetNextWindowPos(vp->WorkPos, ImGuiCond_FirstUseEver);
                ImGui::SetNextWindowSize(ImVec2(320, vp->WorkSize.y), ImGuiCond_FirstUseEver);
                ImGui::Begin("Quote files");
                ImGui::Text("Quote %s", quoteId.c_str());
                if(ImGui::Button("Refresh") && !pendingRows.valid()){
                    pendingRows = std::async(std::launch::async, fetchCatalog, config.viewer.gatewayUrl, quoteId, userHeader);
                }
                if(pendingRows.valid()) ImGui::TextDisabled("Loading...");
                ImGui::Separator();
                for(int i = 0; i < static_cast<int>(rows.size()); ++i){
                    const CatalogRow& r = rows[i];
                    ImGui::PushID(i);
                    std::string label = r.label.empty() ? r.fileName : r.label;
                    if(!r.cadKind.empty()) label += "  [" + r.cadKind + "]";
                    if(ImGui::Selectable(label.c_str(), selected == i)){
                        selected = i;
                        ViewerSource src;
                        src.url = r.previewUrl;
                        src.downloadUrl = r.downloadUrl;
                        src.kind = parseCadKind(r.cadKind);
                        src.declaredFilename = r.fileName;
                        viewer.setSource(src);
                    }
                    if(!r.fallbackMessage.empty()) ImGui::TextDisabled("%s", r.fallbackMessage.c_str());
                    if(r.previewUrl.empty() && !r.downloadUrl.empty() && ImGui::SmallButton("Download"))
                        downloadToDisk(r.downloadUrl, r.fileName, userHeader);
                    ImGui::PopID();
                }
                ImGui::End();
            }

            ImGui::SetNextWindowSize(ImVec2(900, 640), ImGuiCond_FirstUseEver);
            panel.renderWindow("Preview");

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            glfwSwapBuffers(window);
        }
        if(pendingRows.valid()) pendingRows.wait();
        // viewer and device release GL objects here, while the context is still current
    }

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();

    return 0;
}
