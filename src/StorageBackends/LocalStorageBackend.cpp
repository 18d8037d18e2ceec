#include "StorageBackends/LocalStorageBackend.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>
#include <fstream>
#include <system_error>

namespace CadPreview {

LocalStorageBackend::LocalStorageBackend(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path LocalStorageBackend::resolveKey(const StorageKey &key) const
{
    if (key.bucket.empty() || key.path.empty())
        return {};
    if (key.bucket.find('/') != std::string::npos || key.bucket == "." || key.bucket == "..")
        return {};
    std::filesystem::path out = root_ / key.bucket;
    for (const auto &segment : splitPath(key.path))
    {
        if (segment == "." || segment == "..")
            return {};
        out /= segment;
    }
    return out;
}

StorageResult LocalStorageBackend::get(const StorageKey &key)
{
    StorageResult res;
    auto p = resolveKey(key);
    if (p.empty())
    {
        res.error = "invalid storage key";
        return res;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec))
    {
        res.notFound = true;
        res.error = "Object not found";
        return res;
    }
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs)
    {
        res.error = "Failed to open file";
        return res;
    }
    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    res.data = std::move(buf);
    res.ok = true;
    return res;
}

StorageResult LocalStorageBackend::put(const StorageKey &key, const std::vector<uint8_t> &data, const std::string &contentType)
{
    StorageResult res;
    res.contentType = contentType;
    auto p = resolveKey(key);
    if (p.empty())
    {
        res.error = "invalid storage key";
        return res;
    }
    std::lock_guard<std::mutex> lock(mtx);
    try
    {
        auto parent = p.parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent);
        std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
        if (!ofs) { res.error = "Failed to open file for write"; return res; }
        ofs.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!ofs) { res.error = "Short write"; return res; }
        res.ok = true;
    }
    catch (const std::exception &ex)
    {
        res.ok = false;
        res.error = ex.what();
    }
    return res;
}

std::vector<StorageListEntry> LocalStorageBackend::list(const std::string &bucket, const std::string &prefix, std::string *outError)
{
    std::vector<StorageListEntry> out;
    std::filesystem::path dir = root_ / bucket;
    for (const auto &segment : splitPath(prefix))
    {
        if (segment == "..")
        {
            if (outError) *outError = "invalid prefix";
            return out;
        }
        dir /= segment;
    }
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
    {
        if (outError) *outError = ec.message();
        PLOGD << "LocalStorageBackend: list failed for " << dir.string() << ": " << ec.message();
        return out;
    }
    for (const auto &entry : it)
    {
        StorageListEntry e;
        e.name = entry.path().filename().string();
        std::error_code sizeEc;
        if (entry.is_regular_file(sizeEc))
            e.size = static_cast<uint64_t>(entry.file_size(sizeEc));
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace CadPreview
