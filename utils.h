#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

inline int getenv_int(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    try { return std::stoi(v); } catch (const std::logic_error&) { return def; }
}

inline int getenv_int_clamped(const char* name, int def, int lo, int hi) {
    return std::clamp(getenv_int(name, def), lo, hi);
}

inline double getenv_double(const char* name, double def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    try { return std::stod(v); } catch (const std::logic_error&) { return def; }
}

inline bool getenv_bool(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    std::string s(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

inline std::string getenv_string(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    return std::string(v);
}

#endif // UTILS_H
