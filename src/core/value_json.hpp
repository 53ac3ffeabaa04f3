#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

#include "errors.hpp"
#include "value.hpp"

namespace svec {

    // EMPTY maps to null. Found through ADL by nlohmann::json.
    inline void to_json(nlohmann::json& j, const Value& v) {
        switch(v.kind()) {
            case ValueKind::INT:
                j = v.asInt();
                break;
            case ValueKind::FLOAT:
                j = v.asFloat();
                break;
            case ValueKind::TEXT:
                j = v.asText();
                break;
            case ValueKind::EMPTY:
            default:
                j = nullptr;
                break;
        }
    }

    inline void from_json(const nlohmann::json& j, Value& v) {
        if(j.is_number_unsigned()) {
            // Goes through the range-checked unsigned constructor
            v = Value(j.get<uint64_t>());
        } else if(j.is_number_integer()) {
            v = Value(j.get<int64_t>());
        } else if(j.is_number_float()) {
            v = Value(j.get<double>());
        } else if(j.is_string()) {
            v = Value(j.get<std::string>());
        } else {
            throw UnsupportedTypeError(std::string("Cannot store JSON ") + j.type_name()
                                       + " as a vector element");
        }
    }

    inline void to_json(nlohmann::json& j, const IndexValue& iv) {
        j = nlohmann::json{{"index", iv.index}, {"value", iv.value}};
    }

}  //namespace svec
