/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Blob and Value classes,
 * the in-memory form of OSC arguments.
 */

#include <cstring>
#include <sstream>

#include "picoosc/Exceptions.h"
#include "picoosc/Types.h"

namespace picoosc {

    Blob::Blob(std::vector<std::byte> data) : data_(std::move(data)) {}

    Blob::Blob(const void *data, size_t size) : data_(size) {
        if (size > 0) {
            std::memcpy(data_.data(), data, size);
        }
    }

    const std::vector<std::byte> &Blob::data() const { return data_; }

    size_t Blob::size() const { return data_.size(); }

    const std::byte *Blob::bytes() const { return data_.data(); }

    bool Blob::operator==(const Blob &other) const { return data_ == other.data_; }

    bool Blob::operator!=(const Blob &other) const { return !(*this == other); }

    // Constructors for specific types
    Value::Value(Int32 value) : value_(value) {}

    Value::Value(Float value) : value_(value) {}

    Value::Value(const char *value) : value_(String(value)) {}

    Value::Value(String value) : value_(std::move(value)) {}

    Value::Value(Blob value) : value_(std::move(value)) {}

    Value::Value(Bool value) : value_(value) {}

    Value::Value(Array value) : value_(std::move(value)) {}

    Value Value::nil() { return Value(); }

    // Type checking methods
    bool Value::isNil() const { return std::holds_alternative<Nil>(value_); }
    bool Value::isBool() const { return std::holds_alternative<Bool>(value_); }
    bool Value::isInt32() const { return std::holds_alternative<Int32>(value_); }
    bool Value::isFloat() const { return std::holds_alternative<Float>(value_); }
    bool Value::isString() const { return std::holds_alternative<String>(value_); }
    bool Value::isBlob() const { return std::holds_alternative<Blob>(value_); }
    bool Value::isArray() const { return std::holds_alternative<Array>(value_); }

    // Value accessors
    Value::Int32 Value::asInt32() const {
        if (!isInt32()) throw TypeMismatchException("Value is not an Int32");
        return std::get<Int32>(value_);
    }

    Value::Float Value::asFloat() const {
        if (!isFloat()) throw TypeMismatchException("Value is not a Float");
        return std::get<Float>(value_);
    }

    const Value::String &Value::asString() const {
        if (!isString()) throw TypeMismatchException("Value is not a String");
        return std::get<String>(value_);
    }

    const Blob &Value::asBlob() const {
        if (!isBlob()) throw TypeMismatchException("Value is not a Blob");
        return std::get<Blob>(value_);
    }

    Value::Bool Value::asBool() const {
        if (!isBool()) throw TypeMismatchException("Value is not a Bool");
        return std::get<Bool>(value_);
    }

    const Value::Array &Value::asArray() const {
        if (!isArray()) throw TypeMismatchException("Value is not an Array");
        return std::get<Array>(value_);
    }

    char Value::typeTag() const {
        if (isInt32()) return INT32_TAG;
        if (isFloat()) return FLOAT_TAG;
        if (isString()) return STRING_TAG;
        if (isBlob()) return BLOB_TAG;
        if (isBool()) return asBool() ? TRUE_TAG : FALSE_TAG;
        if (isArray()) return ARRAY_BEGIN_TAG;
        return NIL_TAG;
    }

    const Value::Variant &Value::variant() const { return value_; }

    std::string Value::toString() const {
        std::ostringstream out;
        if (isInt32()) {
            out << asInt32();
        } else if (isFloat()) {
            out << asFloat();
        } else if (isString()) {
            out << '"' << asString() << '"';
        } else if (isBlob()) {
            out << "blob(" << asBlob().size() << ")";
        } else if (isBool()) {
            out << (asBool() ? "true" : "false");
        } else if (isArray()) {
            out << '[';
            const auto &items = asArray();
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out << ", ";
                out << items[i].toString();
            }
            out << ']';
        } else {
            out << "nil";
        }
        return out.str();
    }

    bool Value::operator==(const Value &other) const { return value_ == other.value_; }

    bool Value::operator!=(const Value &other) const { return !(*this == other); }

}  // namespace picoosc
