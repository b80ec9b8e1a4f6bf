#include "shell_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <kestrel/logger.hpp>
#include <optional>
#include <sstream>

namespace kestrel
{

void ShellConfig::set_values(const Values& v)
{
    values_ = sanitize(v);
    notify_change();
}

void ShellConfig::reset_to_defaults()
{
    values_ = Values{};
    notify_change();
}

ShellConfig::Values ShellConfig::sanitize(Values v)
{
    v.reconcile_delay_ms   = std::clamp(v.reconcile_delay_ms, 0, 10000);
    v.poll_interval_ms     = std::clamp(v.poll_interval_ms, 50, 600000);
    v.drag_threshold_px    = std::max(0.0f, v.drag_threshold_px);
    v.default_cell_size    = v.default_cell_size > 0.0f ? v.default_cell_size : 36.0f;
    v.default_cell_spacing = std::max(0.0f, v.default_cell_spacing);
    if (!Logger::level_from_string(v.log_level))
        v.log_level = "info";
    return v;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string ShellConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CURRENT_VERSION << ",\n";
    os << "  \"reconcile_delay_ms\": " << values_.reconcile_delay_ms << ",\n";
    os << "  \"poll_interval_ms\": " << values_.poll_interval_ms << ",\n";
    os << "  \"drag_threshold_px\": " << values_.drag_threshold_px << ",\n";
    os << "  \"default_cell_size\": " << values_.default_cell_size << ",\n";
    os << "  \"default_cell_spacing\": " << values_.default_cell_spacing << ",\n";
    os << "  \"log_level\": \"" << escape_json(values_.log_level) << "\",\n";
    os << "  \"haptics_enabled\": " << (values_.haptics_enabled ? "true" : "false") << "\n";
    os << "}\n";
    return os.str();
}

// Minimal reader for the flat object written above.
static std::optional<std::string> raw_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\r\n", pos + 1);
    if (pos == std::string::npos)
        return std::nullopt;

    if (json[pos] == '"')
    {
        size_t end = pos + 1;
        while (end < json.size() && !(json[end] == '"' && json[end - 1] != '\\'))
            ++end;
        if (end >= json.size())
            return std::nullopt;
        return json.substr(pos, end - pos + 1);
    }

    auto end = json.find_first_of(",}\n", pos);
    std::string token = json.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    while (!token.empty() && (token.back() == ' ' || token.back() == '\r' || token.back() == '\t'))
        token.pop_back();
    return token;
}

static void read_int(const std::string& json, const std::string& key, int& out)
{
    if (auto raw = raw_value(json, key))
    {
        char* end = nullptr;
        long  v   = std::strtol(raw->c_str(), &end, 10);
        if (end != raw->c_str())
            out = static_cast<int>(v);
    }
}

static void read_float(const std::string& json, const std::string& key, float& out)
{
    if (auto raw = raw_value(json, key))
    {
        char* end = nullptr;
        float v   = std::strtof(raw->c_str(), &end);
        if (end != raw->c_str())
            out = v;
    }
}

static void read_bool(const std::string& json, const std::string& key, bool& out)
{
    if (auto raw = raw_value(json, key))
    {
        if (*raw == "true")
            out = true;
        else if (*raw == "false")
            out = false;
    }
}

static void read_string(const std::string& json, const std::string& key, std::string& out)
{
    if (auto raw = raw_value(json, key); raw && raw->size() >= 2 && raw->front() == '"')
        out = raw->substr(1, raw->size() - 2);
}

bool ShellConfig::deserialize(const std::string& json)
{
    if (json.find('{') == std::string::npos)
        return false;

    int version = CURRENT_VERSION;
    read_int(json, "version", version);
    if (version > CURRENT_VERSION)
    {
        KESTREL_LOG_WARN("config", "Config version {} is newer than supported {}", version,
                         CURRENT_VERSION);
        return false;
    }

    Values v = Values{};
    read_int(json, "reconcile_delay_ms", v.reconcile_delay_ms);
    read_int(json, "poll_interval_ms", v.poll_interval_ms);
    read_float(json, "drag_threshold_px", v.drag_threshold_px);
    read_float(json, "default_cell_size", v.default_cell_size);
    read_float(json, "default_cell_spacing", v.default_cell_spacing);
    read_string(json, "log_level", v.log_level);
    read_bool(json, "haptics_enabled", v.haptics_enabled);

    values_ = sanitize(std::move(v));
    notify_change();
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool ShellConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);
    if (ec)
        KESTREL_LOG_WARN("config", "Could not create {}: {}", dir.string(), ec.message());

    std::ofstream f(path);
    if (!f.is_open())
    {
        KESTREL_LOG_ERROR("config", "Could not open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool ShellConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        KESTREL_LOG_DEBUG("config", "No config at {}, using defaults", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        KESTREL_LOG_WARN("config", "Ignoring unreadable config {}", path);
        return false;
    }
    KESTREL_LOG_INFO("config", "Loaded config from {}", path);
    return true;
}

std::string ShellConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        return "shell.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "kestrel";
    return (dir / "shell.json").string();
}

void ShellConfig::notify_change()
{
    if (on_change_)
        on_change_(values_);
}

}  // namespace kestrel
