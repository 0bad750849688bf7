#pragma once

#include <vector>
#include <string>
#include <unordered_map>
#include <variant>
#include <cstdint>

namespace qtm {

// Forward declarations
class BencodeValue;
using BencodeDict = std::unordered_map<std::string, BencodeValue>;
using BencodeList = std::vector<BencodeValue>;

/**
 * Represents a bencoded value which can be:
 * - Integer (signed 64-bit)
 * - String (byte string)
 * - List (array of bencoded values)
 * - Dictionary (map of byte-string keys to bencoded values)
 *
 * Encoding is canonical: dictionary keys are always written in byte-wise
 * ascending order no matter how the dictionary was built, and integers
 * are written without leading zeros or sign padding.
 */
class BencodeValue {
public:
    enum class Type {
        Integer,
        String,
        List,
        Dictionary
    };

    // Constructors
    BencodeValue();
    BencodeValue(int64_t value);
    BencodeValue(const std::string& value);
    BencodeValue(std::string&& value);
    BencodeValue(const char* value);
    BencodeValue(const BencodeList& value);
    BencodeValue(const BencodeDict& value);

    // Copy and move constructors
    BencodeValue(const BencodeValue& other);
    BencodeValue(BencodeValue&& other) noexcept;
    BencodeValue& operator=(const BencodeValue& other);
    BencodeValue& operator=(BencodeValue&& other) noexcept;

    ~BencodeValue();

    // Type checking
    bool is_integer() const { return type_ == Type::Integer; }
    bool is_string() const { return type_ == Type::String; }
    bool is_list() const { return type_ == Type::List; }
    bool is_dict() const { return type_ == Type::Dictionary; }

    // Value access (throws std::runtime_error on type mismatch)
    int64_t as_integer() const;
    const std::string& as_string() const;
    const BencodeList& as_list() const;
    const BencodeDict& as_dict() const;

    // Mutable access
    BencodeList& as_list();
    BencodeDict& as_dict();

    // Dictionary operations
    bool has_key(const std::string& key) const;
    const BencodeValue& operator[](const std::string& key) const;
    BencodeValue& operator[](const std::string& key);

    // List operations
    const BencodeValue& operator[](size_t index) const;
    BencodeValue& operator[](size_t index);
    void push_back(const BencodeValue& value);
    void push_back(BencodeValue&& value);
    size_t size() const;

    // Encoding
    std::vector<uint8_t> encode() const;
    std::string encode_string() const;
    void encode_to(std::vector<uint8_t>& buffer) const;

    // Static creation methods
    static BencodeValue create_list();
    static BencodeValue create_dict();

private:
    Type type_;
    std::variant<int64_t, std::string, BencodeList, BencodeDict> value_;
};

/**
 * Strict bencode decoder.
 *
 * Only accepts canonical input: no leading zeros, no "-0", dictionary keys
 * strictly ascending with no duplicates, and no trailing bytes after the
 * top-level value. It exists to check what the encoder produced; malformed
 * input throws std::runtime_error.
 */
class BencodeDecoder {
public:
    static BencodeValue decode(const std::vector<uint8_t>& data);
    static BencodeValue decode(const std::string& data);
    static BencodeValue decode(const uint8_t* data, size_t size);

private:
    static constexpr int MAX_DEPTH = 256;

    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    int depth_;

    BencodeDecoder(const uint8_t* data, size_t size);

    BencodeValue decode_value();
    BencodeValue decode_integer();
    std::string decode_string_raw();
    BencodeValue decode_list();
    BencodeValue decode_dict();

    bool has_more() const { return pos_ < size_; }
    uint8_t current_byte() const;
    uint8_t consume_byte();
};

/**
 * Utility functions
 */
namespace bencode {
    BencodeValue decode(const std::vector<uint8_t>& data);
    BencodeValue decode(const std::string& data);
    std::vector<uint8_t> encode(const BencodeValue& value);
    std::string encode_string(const BencodeValue& value);

    // True if data decodes and re-encodes to exactly the same bytes
    bool is_canonical(const std::vector<uint8_t>& data);
}

} // namespace qtm
