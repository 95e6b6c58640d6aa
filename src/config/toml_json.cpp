#include "config/toml_json.hpp"

#include <sstream>

namespace quill {

namespace {

template<typename T>
std::string to_toml_text(const T& value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

Json toml_to_json(const toml::node& node) {
    if (const auto* tbl = node.as_table()) {
        Json obj = Json::object();
        for (const auto& [key, val] : *tbl) {
            obj[std::string(key.str())] = toml_to_json(val);
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        Json out = Json::array();
        for (const auto& elem : *arr) out.push_back(toml_to_json(elem));
        return out;
    }
    if (const auto* s = node.as_string()) return Json(s->get());
    if (const auto* i = node.as_integer()) return Json(i->get());
    if (const auto* f = node.as_floating_point()) return Json(f->get());
    if (const auto* b = node.as_boolean()) return Json(b->get());
    if (const auto* d = node.as_date()) return Json(to_toml_text(d->get()));
    if (const auto* t = node.as_time()) return Json(to_toml_text(t->get()));
    if (const auto* dt = node.as_date_time()) return Json(to_toml_text(dt->get()));
    return Json();
}

} // namespace quill
