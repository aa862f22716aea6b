#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

using ValueMap = std::map<std::string, std::string>;

// Config values are kept as text; the option parser converts them.
std::optional<std::string> scalar_text(const YAML::Node& node) {
    if (node.IsNull())
        return std::string();
    if (node.IsScalar())
        return node.Scalar();
    return std::nullopt;
}

std::optional<std::string> scalar_text(const json& v) {
    if (v.is_null())
        return std::string();
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_primitive())
        return v.dump();
    return std::nullopt;
}

// Copies scalar entries of @p map into @p out under `prefix + key`. A nested
// map is treated as a category and flattened once; deeper nesting and lists
// are rejected.
bool flatten_yaml(const YAML::Node& map, const std::string& prefix, bool categories, ValueMap& out,
                  std::string& error) {
    for (const auto& kv : map) {
        if (!kv.first.IsScalar())
            continue;
        const std::string key = kv.first.Scalar();
        if (categories && kv.second.IsMap()) {
            if (!flatten_yaml(kv.second, prefix, false, out, error))
                return false;
            continue;
        }
        auto text = scalar_text(kv.second);
        if (!text) {
            error = key + ": expected a scalar value";
            return false;
        }
        out[prefix + key] = *text;
    }
    return true;
}

bool flatten_json(const json& obj, const std::string& prefix, bool categories, ValueMap& out,
                  std::string& error) {
    for (const auto& [key, value] : obj.items()) {
        if (categories && value.is_object()) {
            if (!flatten_json(value, prefix, false, out, error))
                return false;
            continue;
        }
        auto text = scalar_text(value);
        if (!text) {
            error = key + ": expected a scalar value";
            return false;
        }
        out[prefix + key] = *text;
    }
    return true;
}

bool read_yaml(const std::string& path, const std::string& prefix, bool categories,
               ValueMap& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        return flatten_yaml(root, prefix, categories, out, error);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool read_json(const std::string& path, const std::string& prefix, bool categories,
               ValueMap& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        json root = json::parse(ifs);
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        return flatten_json(root, prefix, categories, out, error);
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

void assign_theme_field(const std::string& key, const std::string& val, TuiTheme& theme) {
    if (key == "reset")
        theme.reset = val;
    else if (key == "border")
        theme.border = val;
    else if (key == "title")
        theme.title = val;
    else if (key == "info")
        theme.info = val;
    else if (key == "accent")
        theme.accent = val;
    else if (key.size() == 6 && key.compare(0, 5, "level") == 0 && key[5] >= '0' &&
             key[5] < static_cast<char>('0' + layout::BUCKET_COUNT))
        theme.levels[static_cast<std::size_t>(key[5] - '0')] = val;
}

} // namespace

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    return read_yaml(path, "--", true, opts, error);
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    return read_json(path, "--", true, opts, error);
}

bool load_theme(const std::string& path, TuiTheme& theme, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ValueMap fields;
    bool ok = ext == "json" ? read_json(path, "", false, fields, error)
                            : read_yaml(path, "", false, fields, error);
    if (!ok)
        return false;
    for (const auto& [key, val] : fields)
        assign_theme_field(key, val, theme);
    return true;
}
