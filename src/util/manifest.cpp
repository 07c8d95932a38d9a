#include <pinfold/manifest.hpp>
#include <pinfold/fs_util.hpp>
#include <pinfold/spec.hpp>
#include "toml_config.hpp"

#include <set>
#include <sstream>

namespace pinfold {

static Result<std::vector<std::string>> string_list(const toml::table& env,
                                                    const std::string& key,
                                                    const std::string& source) {
    std::vector<std::string> out;
    const toml::node* node = env.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));

    auto arr = node->as_array();
    if (!arr) {
        return detail::config_error("'" + key + "' must be an array of strings",
                                    node->source(), source);
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return detail::config_error("'" + key + "' must be an array of strings",
                                        elem.source(), source);
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<Manifest> Manifest::parse(const std::string& toml_str, const std::string& source) {
    PINFOLD_TRY_ASSIGN(auto doc, detail::parse_toml(toml_str, source));

    Manifest m;
    m.source = source;
    m.text = toml_str;

    for (const auto& [key, val] : doc) {
        if (key.str() != "env") {
            auto e = detail::config_error("'" + std::string(key.str()) + "' was unexpected",
                                          key.source(), source);
            e.hint = "a manifest holds a single [env] table";
            return e;
        }
    }

    auto env = doc["env"].as_table();
    if (!env) {
        if (const toml::node* node = doc.get("env")) {
            return detail::config_error("'env' must be a table", node->source(), source);
        }
        return Result<Manifest>::ok(std::move(m));
    }

    PINFOLD_TRY_ASSIGN(m.specs, string_list(*env, "specs", source));
    PINFOLD_TRY_ASSIGN(m.includes, string_list(*env, "include", source));

    // Spec strings are checked here so the error can point at the line
    std::set<std::string> names;
    if (auto arr = (*env)["specs"].as_array()) {
        for (const auto& elem : *arr) {
            std::string text = *elem.value<std::string>();
            auto spec = Spec::parse(text);
            if (spec.is_err()) {
                return detail::config_error(spec.error().message, elem.source(), source);
            }
            if (spec.value().is_anonymous()) {
                return detail::config_error("spec '" + text + "' has no package name",
                                            elem.source(), source);
            }
            if (!names.insert(spec.value().name()).second) {
                return detail::config_error("'" + spec.value().name() + "' is listed twice",
                                            elem.source(), source);
            }
        }
    }

    const std::set<std::string> own_keys{"specs", "include"};
    PINFOLD_TRY_ASSIGN(m.inline_config, detail::config_from_toml(*env, source, own_keys));

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& path) {
    PINFOLD_TRY_ASSIGN(auto text, read_file(path));
    return Manifest::parse(text, path);
}

Result<std::string> Manifest::render(const std::vector<std::string>& new_specs) const {
    PINFOLD_TRY_ASSIGN(auto doc, detail::parse_toml(text.empty() ? kDefaultText : text, source));

    toml::array specs_array;
    for (const auto& s : new_specs) specs_array.push_back(s);

    auto env = doc["env"].as_table();
    if (!env) {
        doc.insert_or_assign("env", toml::table{});
        env = doc["env"].as_table();
    }
    env->insert_or_assign("specs", std::move(specs_array));

    std::ostringstream out;
    out << doc << "\n";
    return Result<std::string>::ok(out.str());
}

} // namespace pinfold
