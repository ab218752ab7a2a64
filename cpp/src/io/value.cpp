// ==============================================================================
// value.cpp - Реализация Value (модель JSON документа)
// ==============================================================================

#include <jsondiff/value.hpp>

#include <algorithm>
#include <cmath>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace jsondiff {

const char* value_kind_to_string(ValueKind kind) {
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Bool:
        return "boolean";
    case ValueKind::Number:
        return "number";
    case ValueKind::String:
        return "string";
    case ValueKind::Array:
        return "array";
    case ValueKind::Object:
        return "object";
    }
    return "unknown";
}

ValueKind Value::kind() const {
    if (is_null())
        return ValueKind::Null;
    if (is_bool())
        return ValueKind::Bool;
    if (is_number())
        return ValueKind::Number;
    if (is_string())
        return ValueKind::String;
    if (is_array())
        return ValueKind::Array;
    return ValueKind::Object;
}

// ----------------------------------------------------------------------------
// Операции с объектом
// ----------------------------------------------------------------------------

void Value::set(const std::string& key, Value v) {
    auto* obj = get_object_mut();
    if (obj == nullptr) {
        return;
    }
    for (auto& member : *obj) {
        if (member.first == key) {
            member.second = std::move(v);
            return;
        }
    }
    obj->emplace_back(key, std::move(v));
}

const Value* Value::get(const std::string& key) const {
    const auto* obj = get_object();
    if (obj == nullptr) {
        return nullptr;
    }
    for (const auto& member : *obj) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

MemberIndex index_members(const ValueObject& obj) {
    MemberIndex index;
    index.reserve(obj.size());
    for (const auto& [key, val] : obj) {
        index.emplace(key, &val);
    }
    return index;
}

// ----------------------------------------------------------------------------
// Равенство
// ----------------------------------------------------------------------------

namespace {

bool numbers_equal(const Value& a, const Value& b) {
    if (a.is_double() || b.is_double()) {
        return a.is_double() && b.is_double() && a.as_double() == b.as_double();
    }
    // Оба целые: Int64 всегда отрицательный (см. make_int), но значения,
    // собранные вручную, могут хранить неотрицательное Int64
    if (a.is_int() && b.is_int()) {
        return a.as_int() == b.as_int();
    }
    if (a.is_uint() && b.is_uint()) {
        return a.as_uint() == b.as_uint();
    }
    const Value& i = a.is_int() ? a : b;
    const Value& u = a.is_int() ? b : a;
    return i.as_int() >= 0 && static_cast<std::uint64_t>(i.as_int()) == u.as_uint();
}

}  // namespace

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) {
        return false;
    }

    switch (kind()) {
    case ValueKind::Null:
        return true;
    case ValueKind::Bool:
        return as_bool() == other.as_bool();
    case ValueKind::Number:
        return numbers_equal(*this, other);
    case ValueKind::String:
        return as_string() == other.as_string();
    case ValueKind::Array: {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (&a == &b) {
            return true;
        }
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
    }
    case ValueKind::Object: {
        const auto& a = as_object();
        const auto& b = other.as_object();
        if (&a == &b) {
            return true;
        }
        if (a.size() != b.size()) {
            return false;
        }
        MemberIndex index = index_members(b);
        for (const auto& [key, val] : a) {
            auto it = index.find(key);
            if (it == index.end() || *it->second != val) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson - конверсия в RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        // RapidJSON Writer не умеет писать NaN/Inf без специального флага
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    out.SetObject();
    for (const auto& [key, val] : as_object()) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

std::string Value::to_json() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace jsondiff
