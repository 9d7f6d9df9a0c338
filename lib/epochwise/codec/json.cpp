/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/file.hpp>
#include "json.hpp"

namespace epochwise::codec::json {
    namespace {
        void write_pretty(std::string &out, const value &jv, const size_t depth)
        {
            static constexpr size_t indent_step = 2;
            const auto indent = [&](const size_t d) {
                out.append(d * indent_step, ' ');
            };
            if (const auto *obj = jv.if_object(); obj && !obj->empty()) {
                out += "{\n";
                size_t i = 0;
                for (const auto &kv: *obj) {
                    indent(depth + 1);
                    out += boost::json::serialize(kv.key());
                    out += ": ";
                    write_pretty(out, kv.value(), depth + 1);
                    out += ++i < obj->size() ? ",\n" : "\n";
                }
                indent(depth);
                out += '}';
            } else if (const auto *arr = jv.if_array(); arr && !arr->empty()) {
                out += "[\n";
                size_t i = 0;
                for (const auto &item: *arr) {
                    indent(depth + 1);
                    write_pretty(out, item, depth + 1);
                    out += ++i < arr->size() ? ",\n" : "\n";
                }
                indent(depth);
                out += ']';
            } else {
                // scalars and empty containers have a single-line form
                out += boost::json::serialize(jv);
            }
        }
    }

    value parse(const buffer text)
    {
        return boost::json::parse(static_cast<std::string_view>(text));
    }

    value load(const std::string &path)
    {
        return parse(file::read(path));
    }

    std::string serialize_pretty(const value &jv)
    {
        std::string out {};
        write_pretty(out, jv, 0);
        return out;
    }

    void save_pretty(const std::string &path, const value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}
