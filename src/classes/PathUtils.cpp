#include "PathUtils.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>

std::string trim(const std::string &s)
{
    const size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string toUpper(std::string s)
{
    for (char &c : s) {
        c = (char)std::toupper((unsigned char)c);
    }
    return s;
}

std::string toLower(std::string s)
{
    for (char &c : s) {
        c = (char)std::tolower((unsigned char)c);
    }
    return s;
}

std::vector<std::string> splitList(const std::string &s, char sep)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            pos = s.size();
        }
        const std::string item = trim(s.substr(start, pos - start));
        if (!item.empty()) {
            out.push_back(item);
        }
        start = pos + 1;
    }
    return out;
}

bool isAbsPath(const std::string &p)
{
    if (p.empty()) {
        return false;
    }
    if (p[0] == '/' || p[0] == '\\') {
        return true;
    }
    if (p.size() >= 2 && std::isalpha((unsigned char)p[0]) && p[1] == ':') {
        return true;
    }
    return false;
}

std::string dirnameOf(const std::string &p)
{
    const size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return p.substr(0, pos);
}

std::string basenameOf(const std::string &p)
{
    const size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return p;
    }
    return p.substr(pos + 1);
}

std::string joinPath(const std::string &a, const std::string &b)
{
    if (a.empty()) {
        return b;
    }
    if (b.empty()) {
        return a;
    }
    if (a.back() == '/') {
        return a + b;
    }
    return a + "/" + b;
}

bool fileExists(const std::string &p)
{
    struct stat st;
    return stat(p.c_str(), &st) == 0;
}

bool makeDirs(const std::string &p)
{
    if (p.empty()) {
        return false;
    }
    std::string cur;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = p.find('/', pos + 1);
        cur = p.substr(0, pos);
        if (cur.empty()) {
            continue;
        }
        if (mkdir(cur.c_str(), 0777) != 0 && errno != EEXIST) {
            return false;
        }
    }
    struct stat st;
    return stat(p.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool removeFile(const std::string &p)
{
    if (unlink(p.c_str()) == 0) {
        return true;
    }
    return errno == ENOENT;
}

bool renameFile(const std::string &from, const std::string &to)
{
    return std::rename(from.c_str(), to.c_str()) == 0;
}
