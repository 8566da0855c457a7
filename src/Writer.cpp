/**
 * @file Writer.cpp
 * @brief Document serialization implementation
 */

#include "dedupe/Writer.hpp"
#include "dedupe/Errors.hpp"
#include "dedupe/Parse.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace dedupe {

// ---- Value -> YAML ----------------------------------------------------------
namespace {

// A plain scalar that parse_scalar() would type as anything but a string
// has to be quoted to survive a reload.
bool needs_quotes(const std::string& s) {
    return !parse_scalar(s).is_string();
}

std::string format_float(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d > 0 ? ".inf" : "-.inf";
    // nlohmann prints the shortest round-trip form and keeps a ".0"
    return Value(d).dump();
}

void emit_value(YAML::Emitter& out, const Value& v) {
    if (v.is_null()) {
        out << YAML::Null;
    } else if (v.is_boolean()) {
        out << v.get<bool>();
    } else if (v.is_number_unsigned()) {
        out << v.get<std::uint64_t>();
    } else if (v.is_number_integer()) {
        out << v.get<std::int64_t>();
    } else if (v.is_number_float()) {
        out << format_float(v.get<double>());
    } else if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (needs_quotes(s)) {
            out << YAML::DoubleQuoted;
        }
        out << s;
    } else if (v.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& elem : v) {
            emit_value(out, elem);
        }
        out << YAML::EndSeq;
    } else if (v.is_object()) {
        out << YAML::BeginMap;
        for (auto it = v.begin(); it != v.end(); ++it) {
            out << YAML::Key;
            if (it.key().empty()) {
                out << YAML::DoubleQuoted;
            }
            out << it.key() << YAML::Value;
            emit_value(out, it.value());
        }
        out << YAML::EndMap;
    }
}

} // namespace

std::string to_yaml_string(const Value& doc) {
    YAML::Emitter out;
    out.SetIndent(2);
    emit_value(out, doc);
    if (!out.good()) {
        throw DedupeError("YAML emitter error: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::string to_json_string(const Value& doc, int indent) {
    return doc.dump(indent, ' ', false, Value::error_handler_t::replace) + "\n";
}

// ---- Value -> TOML (value-based construction; no raw nodes) -----------------
namespace {

    inline void insert_scalar(toml::table& tbl, const std::string& key, const Value& v) {
        if (v.is_string()) {
            tbl.insert(key, v.get<std::string>());
        } else if (v.is_boolean()) {
            tbl.insert(key, v.get<bool>());
        } else if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                tbl.insert(key, static_cast<std::int64_t>(u));
            } else {
                // Oversize for TOML int; fall back to double
                tbl.insert(key, static_cast<double>(u));
            }
        } else if (v.is_number_integer()) {
            tbl.insert(key, v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            tbl.insert(key, v.get<double>());
        } else if (v.is_null()) {
            // No TOML null: preserve as empty string
            tbl.insert(key, std::string{""});
        } else {
            tbl.insert(key, v.dump());
        }
    }

    toml::array make_array(const Value& a); // fwd
    toml::table make_table(const Value& o); // fwd

    toml::array make_array(const Value& a) {
        toml::array out;
        for (const auto& elem : a) {
            if (elem.is_object()) {
                out.push_back(make_table(elem));
            } else if (elem.is_array()) {
                out.push_back(make_array(elem));
            } else if (elem.is_string()) {
                out.push_back(elem.get<std::string>());
            } else if (elem.is_boolean()) {
                out.push_back(elem.get<bool>());
            } else if (elem.is_number_unsigned()) {
                const auto u = elem.get<std::uint64_t>();
                if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                    out.push_back(static_cast<std::int64_t>(u));
                else
                    out.push_back(static_cast<double>(u));
            } else if (elem.is_number_integer()) {
                out.push_back(elem.get<std::int64_t>());
            } else if (elem.is_number_float()) {
                out.push_back(elem.get<double>());
            } else if (elem.is_null()) {
                out.push_back(std::string{""});
            } else {
                out.push_back(elem.dump());
            }
        }
        return out;
    }

    toml::table make_table(const Value& o) {
        toml::table tbl;
        for (auto it = o.begin(); it != o.end(); ++it) {
            const auto& k = it.key();
            const auto& v = it.value();
            if (v.is_object()) {
                tbl.insert(k, make_table(v));
            } else if (v.is_array()) {
                tbl.insert(k, make_array(v));
            } else {
                insert_scalar(tbl, k, v);
            }
        }
        return tbl;
    }

} // namespace

std::string to_toml_string(const Value& doc) {
    if (!doc.is_object()) {
        throw DedupeError("TOML output requires a mapping at the root, got " + type_name(doc));
    }
    toml::table root = make_table(doc);

    std::ostringstream oss;
    oss << root << "\n";
    return oss.str();
}

std::string to_string(const Value& doc, DocumentFormat format) {
    switch (format) {
        case DocumentFormat::json:
            return to_json_string(doc);
        case DocumentFormat::toml:
            return to_toml_string(doc);
        case DocumentFormat::yaml:
            break;
    }
    return to_yaml_string(doc);
}

// ---- Files ------------------------------------------------------------------

void write_document(const std::string& path, const Value& doc) {
    std::string text;
    try {
        text = to_string(doc, detect_format(path));
    } catch (const DedupeError& e) {
        throw IOError(path, e.what());
    } catch (const nlohmann::json::exception& e) {
        throw IOError(path, e.what());
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw IOError(path, "cannot open for writing");
    }
    ofs << text;
    ofs.flush();
    if (!ofs) {
        throw IOError(path, "write failed");
    }
}

std::string backup_path_for(const std::string& path) {
    return path + ".bak";
}

std::string backup_file(const std::string& path) {
    const std::string backup_path = backup_path_for(path);

    std::error_code ec;
    fs::copy_file(path, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IOError(path, "backup to '" + backup_path + "' failed: " + ec.message());
    }
    return backup_path;
}

} // namespace dedupe
