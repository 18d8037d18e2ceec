#include "Preview/StepConverter.hpp"
#include "CryptoHelpers.hpp"
#include <plog/Log.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace CadPreview {

bool looksLikeStl(const std::vector<uint8_t>& bytes){
    if(bytes.size() >= 84){
        uint32_t count = static_cast<uint32_t>(bytes[80]) | (static_cast<uint32_t>(bytes[81]) << 8) |
                         (static_cast<uint32_t>(bytes[82]) << 16) | (static_cast<uint32_t>(bytes[83]) << 24);
        if(count > 0 && 84ull + 50ull * count == bytes.size()) return true;
    }
    std::string head(bytes.begin(), bytes.begin() + std::min<size_t>(bytes.size(), 512));
    size_t i = 0;
    while(i < head.size() && std::isspace(static_cast<unsigned char>(head[i]))) ++i;
    return head.compare(i, 5, "solid") == 0 && head.find("facet", i) != std::string::npos;
}

ExternalStepConverter::ExternalStepConverter(std::string commandTemplate, int timeoutSeconds)
    : commandTemplate_(std::move(commandTemplate)), timeoutSeconds_(timeoutSeconds > 0 ? timeoutSeconds : 120) {}

bool ExternalStepConverter::runProcess(const std::vector<std::string>& argv, std::string* outError) const {
    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for(const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    const pid_t pid = fork();
    if(pid < 0){
        if(outError) *outError = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if(pid == 0){
        execvp(cargs[0], cargs.data());
        _exit(127);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds_);
    int status = 0;
    while(true){
        pid_t r = waitpid(pid, &status, WNOHANG);
        if(r == pid) break;
        if(r < 0){
            if(outError) *outError = std::string("waitpid failed: ") + std::strerror(errno);
            return false;
        }
        if(std::chrono::steady_clock::now() >= deadline){
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            if(outError) *outError = "converter timed out after " + std::to_string(timeoutSeconds_) + "s";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if(!WIFEXITED(status)){
        if(outError) *outError = "converter terminated abnormally";
        return false;
    }
    if(WEXITSTATUS(status) != 0){
        if(outError) *outError = "converter exited with status " + std::to_string(WEXITSTATUS(status));
        return false;
    }
    return true;
}

StepConversionResult ExternalStepConverter::convert(const std::vector<uint8_t>& stepBytes, const std::string& requestId){
    StepConversionResult out;
    if(!available()){ out.error = "no converter configured"; return out; }
    if(stepBytes.empty()){ out.error = "empty STEP input"; return out; }

    std::error_code ec;
    std::filesystem::path workDir = std::filesystem::temp_directory_path(ec) / ("cadpreview-" + requestId + "-" + CryptoHelpers::randomHex(4));
    if(ec || !std::filesystem::create_directories(workDir, ec)){
        out.error = "could not create work dir: " + ec.message();
        return out;
    }
    std::filesystem::path input = workDir / "source.step";
    std::filesystem::path output = workDir / "preview.stl";

    {
        std::ofstream ofs(input, std::ios::binary);
        ofs.write(reinterpret_cast<const char*>(stepBytes.data()), static_cast<std::streamsize>(stepBytes.size()));
        if(!ofs){
            out.error = "could not write STEP input";
            std::filesystem::remove_all(workDir, ec);
            return out;
        }
    }

    std::vector<std::string> argv;
    std::istringstream iss(commandTemplate_);
    std::string tok;
    while(iss >> tok){
        if(tok == "{input}") tok = input.string();
        else if(tok == "{output}") tok = output.string();
        argv.push_back(tok);
    }

    PLOGI << "[cad-preview] rid=" << requestId << " stage=convert_step_to_stl exec=" << (argv.empty() ? std::string() : argv.front());
    std::string err;
    if(argv.empty() || !runProcess(argv, &err)){
        out.error = argv.empty() ? std::string("empty converter command") : err;
        std::filesystem::remove_all(workDir, ec);
        return out;
    }

    std::ifstream ifs(output, std::ios::binary);
    if(ifs){
        out.stl.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }
    ifs.close();
    std::filesystem::remove_all(workDir, ec);

    if(out.stl.empty()){ out.error = "converter produced no output"; return out; }
    if(!looksLikeStl(out.stl)){ out.error = "converter output is not STL"; out.stl.clear(); return out; }
    out.ok = true;
    return out;
}

} // namespace CadPreview
