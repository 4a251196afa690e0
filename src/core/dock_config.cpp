#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <panedock/dock_config.hpp>
#include <panedock/logger.hpp>
#include <sstream>
#include <system_error>

#include "json.hpp"

namespace panedock
{

// ─── JSON serialization ──────────────────────────────────────────────────────

static void write_zone_params(std::ostream& os, const char* key, const DropZoneParams& p, bool last)
{
    os << "  \"" << key << "\": { \"edgeRatio\": " << json::format_number(p.edge_ratio)
       << ", \"minBand\": " << json::format_number(p.min_band)
       << ", \"maxBand\": " << json::format_number(p.max_band) << " }";
    os << (last ? "\n" : ",\n");
}

std::string DockConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << FORMAT_VERSION << ",\n";
    write_zone_params(os, "paneZones", pane_zones, false);
    write_zone_params(os, "rootZones", root_zones, false);
    write_zone_params(os, "externalZones", external_zones, false);
    os << "  \"centerDropSwaps\": " << (center_drop_swaps ? "true" : "false") << ",\n";
    os << "  \"dragThreshold\": " << json::format_number(drag_threshold) << ",\n";
    os << "  \"paneHeaderHeight\": " << json::format_number(pane_header_height) << ",\n";
    os << "  \"floatingDefaultWidth\": " << json::format_number(floating_default_width) << ",\n";
    os << "  \"floatingDefaultHeight\": " << json::format_number(floating_default_height)
       << ",\n";
    os << "  \"floatingMinWidth\": " << json::format_number(floating_min_width) << ",\n";
    os << "  \"floatingMinHeight\": " << json::format_number(floating_min_height) << ",\n";
    os << "  \"floatingOffset\": " << json::format_number(floating_offset) << ",\n";
    os << "  \"paneIdPrefix\": \"" << json::escape(pane_id_prefix) << "\",\n";
    os << "  \"defaultTitle\": \"" << json::escape(default_title) << "\",\n";
    os << "  \"defaultPlaceholder\": \"" << json::escape(default_placeholder) << "\"\n";
    os << "}\n";
    return os.str();
}

static void read_zone_params(const json::Value& root, const char* key, DropZoneParams& out)
{
    const json::Value* obj = root.find(key);
    if (!obj || !obj->is_object())
        return;
    if (auto v = obj->float_member("edgeRatio"); v && *v >= 0.0f && *v <= 0.5f)
        out.edge_ratio = *v;
    if (auto v = obj->float_member("minBand"); v && *v >= 0.0f)
        out.min_band = *v;
    if (auto v = obj->float_member("maxBand"); v && *v >= 0.0f)
        out.max_band = *v;
    if (out.max_band < out.min_band)
        out.max_band = out.min_band;
}

static void read_positive(const json::Value& root, const char* key, float& out)
{
    if (auto v = root.float_member(key); v && *v >= 0.0f)
        out = *v;
}

bool DockConfig::deserialize(const std::string& json)
{
    auto doc = json::Value::parse(json);
    if (!doc || !doc->is_object())
    {
        PANEDOCK_LOG_WARN("config", "dock config is not a JSON object");
        return false;
    }

    if (auto ver = doc->number_member("version"); ver && *ver > FORMAT_VERSION)
    {
        PANEDOCK_LOG_WARN("config", "dock config version {} is newer than supported {}", *ver,
                          FORMAT_VERSION);
        return false;
    }

    DockConfig cfg;
    read_zone_params(*doc, "paneZones", cfg.pane_zones);
    read_zone_params(*doc, "rootZones", cfg.root_zones);
    read_zone_params(*doc, "externalZones", cfg.external_zones);
    if (auto v = doc->bool_member("centerDropSwaps"))
        cfg.center_drop_swaps = *v;
    read_positive(*doc, "dragThreshold", cfg.drag_threshold);
    read_positive(*doc, "paneHeaderHeight", cfg.pane_header_height);
    read_positive(*doc, "floatingDefaultWidth", cfg.floating_default_width);
    read_positive(*doc, "floatingDefaultHeight", cfg.floating_default_height);
    read_positive(*doc, "floatingMinWidth", cfg.floating_min_width);
    read_positive(*doc, "floatingMinHeight", cfg.floating_min_height);
    read_positive(*doc, "floatingOffset", cfg.floating_offset);
    if (auto v = doc->string_member("paneIdPrefix"); v && !v->empty())
        cfg.pane_id_prefix = *v;
    if (auto v = doc->string_member("defaultTitle"))
        cfg.default_title = *v;
    if (auto v = doc->string_member("defaultPlaceholder"))
        cfg.default_placeholder = *v;

    *this = std::move(cfg);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool DockConfig::save(const std::string& path) const
{
    auto            dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            PANEDOCK_LOG_WARN("config", "cannot create '{}': {}", dir.string(), ec.message());
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        PANEDOCK_LOG_WARN("config", "cannot open '{}' for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool DockConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string DockConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "dock.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "panedock";
    return (dir / "dock.json").string();
}

}  // namespace panedock
