#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

static std::string trimCopy(const std::string &str)
{
    size_t s = 0;
    size_t e = str.size();
    while (s < e && std::isspace(static_cast<unsigned char>(str[s])))
        ++s;
    while (e > s && std::isspace(static_cast<unsigned char>(str[e - 1])))
        --e;
    return str.substr(s, e - s);
}

static std::string toLowerCopy(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

static bool startsWith(const std::string &str, const std::string &prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

static bool equalsIgnoreCase(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// "a//b///c" -> "a/b/c"
static std::string collapseSlashes(const std::string &str)
{
    std::string out;
    out.reserve(str.size());
    for (char c : str)
    {
        if (c == '/' && !out.empty() && out.back() == '/')
            continue;
        out.push_back(c);
    }
    return out;
}

static std::string stripLeadingSlashes(const std::string &str)
{
    size_t i = 0;
    while (i < str.size() && str[i] == '/')
        ++i;
    return str.substr(i);
}

static std::vector<std::string> splitPath(const std::string &str)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= str.size())
    {
        size_t slash = str.find('/', start);
        if (slash == std::string::npos)
            slash = str.size();
        if (slash > start)
            parts.push_back(str.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

// Final path segment, or the whole string when it has no slash.
static std::string lastPathSegment(const std::string &str)
{
    auto pos = str.find_last_of('/');
    if (pos == std::string::npos)
        return str;
    return str.substr(pos + 1);
}

// Lowercased extension without the dot; empty when there is none.
static std::string fileExtension(const std::string &name)
{
    std::string base = lastPathSegment(trimCopy(name));
    auto dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= base.size())
        return std::string();
    return toLowerCopy(base.substr(dot + 1));
}

static std::string stripExtension(const std::string &name)
{
    auto slash = name.find_last_of('/');
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return name;
    return name.substr(0, dot);
}

static std::string urlEncode(const std::string &str)
{
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

// Same as urlEncode but keeps '/' so object paths stay readable in URLs.
static std::string urlEncodePath(const std::string &path)
{
    std::string out;
    auto parts = splitPath(path);
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i)
            out.push_back('/');
        out += urlEncode(parts[i]);
    }
    return out;
}

static std::string urlDecode(const std::string &str)
{
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '%' && i + 2 < str.size() && std::isxdigit(static_cast<unsigned char>(str[i + 1])) && std::isxdigit(static_cast<unsigned char>(str[i + 2])))
        {
            out.push_back(static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        }
        else
        {
            out.push_back(str[i]);
        }
    }
    return out;
}
