// ==============================================================================
// jsondiff/value.hpp - Модель JSON документа (Value)
// ==============================================================================
//
// Назначение:
// - Представление распарсенного JSON документа (tagged union)
// - Объект с упорядоченными ключами (порядок вставки сохраняется для вывода)
// - Структурное равенство (порядок ключей объекта не значим)
// - Конверсия в RapidJSON Value для сериализации
//
// ==============================================================================

#ifndef JSONDIFF_VALUE_HPP
#define JSONDIFF_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace jsondiff {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта: пары (ключ, значение) в порядке вставки, ключи уникальны
using ValueObject = std::vector<std::pair<std::string, Value>>;

/// Вид значения (без разделения чисел на Int/UInt/Double)
enum class ValueKind { Null, Bool, Number, String, Array, Object };

/// Строковое имя вида значения
const char* value_kind_to_string(ValueKind kind);

/// Каноническое представление JSON значения
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    // Массивы и объекты разделяются между копиями через shared_ptr:
    // дерево неизменяемо после парсинга, копия DiffEntry дешёвая
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }

    /// Целое число: неотрицательные хранятся как UInt64, отрицательные как Int64
    static Value make_int(std::int64_t v) {
        return v >= 0 ? Value(static_cast<std::uint64_t>(v)) : Value(v);
    }

    static Value make_uint(std::uint64_t v) { return Value(v); }
    static Value make_double(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    bool is_number() const { return is_int() || is_uint() || is_double(); }

    /// Вид значения для сравнения вариантов
    ValueKind kind() const;

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        const auto* arr = get_array();
        return arr ? arr->size() : 0;
    }

    /// Элемент массива по индексу (nullptr вне диапазона)
    const Value* at(std::size_t index) const {
        const auto* arr = get_array();
        if (arr != nullptr && index < arr->size()) {
            return &(*arr)[index];
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта. Существующий ключ сохраняет позицию,
    /// значение заменяется; новый ключ добавляется в конец.
    void set(const std::string& key, Value v);

    /// Поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const;

    bool has(const std::string& key) const { return get(key) != nullptr; }

    std::size_t object_size() const {
        const auto* obj = get_object();
        return obj ? obj->size() : 0;
    }

    // -------------------------------------------------------------------------
    // Равенство
    // -------------------------------------------------------------------------

    /// Глубокое структурное равенство.
    /// Целые сравниваются по математическому значению (Int64 == UInt64),
    /// целое никогда не равно Double; порядок ключей объекта не значим.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Сериализация
    // -------------------------------------------------------------------------

    /// Конвертировать в RapidJSON Value (порядок ключей сохраняется)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Компактный JSON текст
    std::string to_json() const;

private:
    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

/// Хеш-индекс ключей объекта: ключ -> значение.
/// Указатели действительны, пока объект не изменяется.
using MemberIndex = std::unordered_map<std::string_view, const Value*>;

/// Построить индекс ключей объекта за один проход
MemberIndex index_members(const ValueObject& obj);

}  // namespace jsondiff

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // JSONDIFF_VALUE_HPP
