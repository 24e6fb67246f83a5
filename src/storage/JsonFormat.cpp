#include "storage/JsonFormat.h"

#include <sstream>

namespace relaychat::storage {

namespace json = boost::json;

void pretty_print(std::ostream& os, const json::value& jv, std::string* indent) {
    std::string indent_;
    if (!indent) indent = &indent_;

    switch (jv.kind()) {
        case json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty()) {
                os << "{}";
                break;
            }
            os << "{\n";
            indent->append(2, ' ');
            auto it = obj.begin();
            for (;;) {
                os << *indent << json::serialize(it->key()) << ": ";
                pretty_print(os, it->value(), indent);
                if (++it == obj.end()) break;
                os << ",\n";
            }
            os << "\n";
            indent->resize(indent->size() - 2);
            os << *indent << "}";
            break;
        }

        case json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty()) {
                os << "[]";
                break;
            }
            os << "[\n";
            indent->append(2, ' ');
            auto it = arr.begin();
            for (;;) {
                os << *indent;
                pretty_print(os, *it, indent);
                if (++it == arr.end()) break;
                os << ",\n";
            }
            os << "\n";
            indent->resize(indent->size() - 2);
            os << *indent << "]";
            break;
        }

        default:
            os << json::serialize(jv);
            break;
    }

    if (indent->empty()) os << "\n";
}

std::string to_pretty_string(const json::value& jv) {
    std::ostringstream ss;
    pretty_print(ss, jv);
    return ss.str();
}

} // namespace relaychat::storage
