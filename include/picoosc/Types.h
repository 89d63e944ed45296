/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file defines core types used throughout the PicoOSC library.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "picoosc/Exceptions.h"

namespace picoosc {

    /**
     * @brief Class representing an OSC Time Tag
     *
     * OSC Time Tags are 64-bit fixed-point numbers representing
     * time in NTP format (seconds since Jan 1, 1900).
     */
    class TimeTag {
       public:
        /**
         * @brief Default constructor (creates an immediate time tag)
         */
        TimeTag();

        /**
         * @brief Construct from NTP format (64-bit)
         * @param ntp NTP timestamp
         */
        explicit TimeTag(uint64_t ntp);

        /**
         * @brief Construct from seconds and fraction
         * @param seconds Seconds since Jan 1, 1900
         * @param fraction Fractional seconds (0-0xFFFFFFFF)
         */
        TimeTag(uint32_t seconds, uint32_t fraction);

        /**
         * @brief Construct from std::chrono::system_clock::time_point
         * @param tp Time point
         */
        explicit TimeTag(std::chrono::system_clock::time_point tp);

        /**
         * @brief Get current time as TimeTag
         */
        static TimeTag now();

        /**
         * @brief Get immediate execution time tag (special value 0x0000000000000001)
         */
        static TimeTag immediate();

        uint64_t toNTP() const;
        std::chrono::system_clock::time_point toTimePoint() const;
        uint32_t seconds() const;
        uint32_t fraction() const;
        bool isImmediate() const;

        bool operator==(const TimeTag &other) const;
        bool operator!=(const TimeTag &other) const;
        bool operator<(const TimeTag &other) const;

       private:
        uint32_t seconds_;   ///< Seconds since Jan 1, 1900
        uint32_t fraction_;  ///< Fractional seconds (0-0xFFFFFFFF)
    };

    /**
     * @brief Class representing an OSC Blob
     *
     * OSC Blobs are binary data with a specified size.
     */
    class Blob {
       public:
        Blob() = default;

        /**
         * @brief Construct from data
         * @param data Binary data
         */
        explicit Blob(std::vector<std::byte> data);

        /**
         * @brief Construct from raw data
         * @param data Pointer to data
         * @param size Size of data in bytes
         */
        Blob(const void *data, size_t size);

        const std::vector<std::byte> &data() const;
        size_t size() const;
        const std::byte *bytes() const;

        bool operator==(const Blob &other) const;
        bool operator!=(const Blob &other) const;

       private:
        std::vector<std::byte> data_;
    };

    /**
     * @brief Class representing one OSC argument
     *
     * The set of argument types is closed: nil, booleans, 32-bit integers and
     * floats, strings, blobs and arrays of further values.
     */
    class Value {
       public:
        // Type tag constants
        static constexpr char INT32_TAG = 'i';
        static constexpr char FLOAT_TAG = 'f';
        static constexpr char STRING_TAG = 's';
        static constexpr char BLOB_TAG = 'b';
        static constexpr char TRUE_TAG = 'T';
        static constexpr char FALSE_TAG = 'F';
        static constexpr char NIL_TAG = 'N';
        static constexpr char ARRAY_BEGIN_TAG = '[';
        static constexpr char ARRAY_END_TAG = ']';

        // Type definitions
        using Int32 = int32_t;
        using Float = float;
        using String = std::string;
        using Bool = bool;
        using Nil = std::monostate;
        using Array = std::vector<Value>;

        using Variant = std::variant<Nil,     // N
                                     Bool,    // T, F
                                     Int32,   // i
                                     Float,   // f
                                     String,  // s
                                     Blob,    // b
                                     Array    // [ ... ]
                                     >;

        // Default constructor (creates Nil value)
        Value() : value_(Nil{}) {}

        // Constructors for specific types
        Value(Int32 value);
        Value(Float value);
        Value(const char *value);
        Value(String value);
        Value(Blob value);
        Value(Bool value);
        Value(Array value);

        static Value nil();

        // Type checking
        bool isNil() const;
        bool isBool() const;
        bool isInt32() const;
        bool isFloat() const;
        bool isString() const;
        bool isBlob() const;
        bool isArray() const;

        // Value accessors (with type checking)
        Int32 asInt32() const;
        Float asFloat() const;
        const String &asString() const;
        const Blob &asBlob() const;
        Bool asBool() const;
        const Array &asArray() const;

        /**
         * @brief Get the type tag for this value
         *
         * Arrays report ARRAY_BEGIN_TAG; their full tag sequence is produced by the codec.
         */
        char typeTag() const;

        const Variant &variant() const;

        /**
         * @brief Human readable form, e.g. 42, 1.5, "text", blob(3), [1, 2]
         */
        std::string toString() const;

        bool operator==(const Value &other) const;
        bool operator!=(const Value &other) const;

       private:
        Variant value_;
    };

}  // namespace picoosc
