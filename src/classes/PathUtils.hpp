//  PathUtils.hpp
//  gridtiler
//
//  String and POSIX path helpers shared by the cfg reader and the
//  artifact I/O.
//
#ifndef PathUtils_hpp
#define PathUtils_hpp

#include <string>
#include <vector>

std::string trim(const std::string &s);
std::string toUpper(std::string s);
std::string toLower(std::string s);

/* Split on sep, trimming items and dropping empty ones. */
std::vector<std::string> splitList(const std::string &s, char sep);

bool isAbsPath(const std::string &p);
std::string dirnameOf(const std::string &p);
std::string basenameOf(const std::string &p);
std::string joinPath(const std::string &a, const std::string &b);

bool fileExists(const std::string &p);
/* mkdir -p; returns false if the directory cannot be created. */
bool makeDirs(const std::string &p);
/* unlink; a file that is already gone counts as removed. */
bool removeFile(const std::string &p);
bool renameFile(const std::string &from, const std::string &to);

#endif /* PathUtils_hpp */
