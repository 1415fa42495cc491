#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace voxcall {

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline bool is_quoted(const string& s) {
    return s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''));
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

static std::optional<int> as_int(const string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

static std::optional<bool> as_bool(const string& s) {
    if (ieq(s, "true") || ieq(s,"yes") || s=="1") return true;
    if (ieq(s, "false")|| ieq(s,"no")  || s=="0") return false;
    return std::nullopt;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/voxcall/voxcall.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/voxcall/voxcall.toml";
}

std::string default_db_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return string(xdg) + "/voxcall/voxcall.db";
    const char* home = std::getenv("HOME");
    return string(home ? home : ".") + "/.local/share/voxcall/voxcall.db";
}

FileConfig load_config_file(const std::string& path) {
    FileConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        // strip comments outside quotes
        char quote = 0;
        size_t pos_cmt = line.size();
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote) { if (c == quote) quote = 0; }
            else if (c == '"' || c == '\'') quote = c;
            else if (c == '#' || c == ';') { pos_cmt = i; break; }
        }
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty() || line.front() == '[') continue; // TOML section headers are ignored

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;

        if (is_quoted(val)) val = val.substr(1, val.size()-2);

        if (ieq(key, "server_url")) cfg.server_url = val;
        else if (ieq(key, "api_url")) cfg.api_url = val;
        else if (ieq(key, "input_device") || ieq(key, "device")) cfg.input_device = as_int(val);
        else if (ieq(key, "output_device")) cfg.output_device = as_int(val);
        else if (ieq(key, "sample_rate")) cfg.sample_rate = as_int(val);
        else if (ieq(key, "frame_ms")) cfg.frame_ms = as_int(val);
        else if (ieq(key, "db_path")) cfg.db_path = expand_path(val);
        else if (ieq(key, "journal")) cfg.journal = as_bool(val);
        else if (ieq(key, "verbose")) cfg.verbose = as_bool(val);
        else std::cerr << "Warning: " << path << ":" << lineno << ": unknown key '" << key << "'" << std::endl;
    }
    return cfg;
}

void apply_file_config(AppConfig& cfg, const FileConfig& file) {
    if (file.server_url) cfg.server_url = *file.server_url;
    if (file.api_url) cfg.api_url = *file.api_url;
    if (file.input_device) cfg.input_device = file.input_device;
    if (file.output_device) cfg.output_device = file.output_device;
    if (file.sample_rate && *file.sample_rate > 0) cfg.sample_rate = *file.sample_rate;
    if (file.frame_ms && *file.frame_ms > 0) cfg.frame_ms = *file.frame_ms;
    if (file.db_path) cfg.db_path = *file.db_path;
    if (file.journal) cfg.journal = *file.journal;
    if (file.verbose) cfg.verbose = *file.verbose;
}

void apply_environment(AppConfig& cfg) {
    const char* ws = std::getenv("VOXCALL_WS_URL");
    if (ws && *ws) cfg.server_url = ws;
    const char* api = std::getenv("VOXCALL_API_URL");
    if (api && *api) cfg.api_url = api;
}

} // namespace voxcall
