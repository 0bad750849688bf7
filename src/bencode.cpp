#include "bencode.h"
#include <stdexcept>
#include <algorithm>
#include <limits>

namespace qtm {

//=============================================================================
// BencodeValue
//=============================================================================

BencodeValue::BencodeValue() : type_(Type::String), value_(std::string()) {}

BencodeValue::BencodeValue(int64_t value) : type_(Type::Integer), value_(value) {}

BencodeValue::BencodeValue(const std::string& value) : type_(Type::String), value_(value) {}

BencodeValue::BencodeValue(std::string&& value) : type_(Type::String), value_(std::move(value)) {}

BencodeValue::BencodeValue(const char* value) : type_(Type::String), value_(std::string(value)) {}

BencodeValue::BencodeValue(const BencodeList& value) : type_(Type::List), value_(value) {}

BencodeValue::BencodeValue(const BencodeDict& value) : type_(Type::Dictionary), value_(value) {}

BencodeValue::BencodeValue(const BencodeValue& other) : type_(other.type_), value_(other.value_) {}

BencodeValue::BencodeValue(BencodeValue&& other) noexcept : type_(other.type_), value_(std::move(other.value_)) {}

BencodeValue& BencodeValue::operator=(const BencodeValue& other) {
    if (this != &other) {
        type_ = other.type_;
        value_ = other.value_;
    }
    return *this;
}

BencodeValue& BencodeValue::operator=(BencodeValue&& other) noexcept {
    if (this != &other) {
        type_ = other.type_;
        value_ = std::move(other.value_);
    }
    return *this;
}

BencodeValue::~BencodeValue() = default;

int64_t BencodeValue::as_integer() const {
    if (type_ != Type::Integer) {
        throw std::runtime_error("BencodeValue is not an integer");
    }
    return std::get<int64_t>(value_);
}

const std::string& BencodeValue::as_string() const {
    if (type_ != Type::String) {
        throw std::runtime_error("BencodeValue is not a string");
    }
    return std::get<std::string>(value_);
}

const BencodeList& BencodeValue::as_list() const {
    if (type_ != Type::List) {
        throw std::runtime_error("BencodeValue is not a list");
    }
    return std::get<BencodeList>(value_);
}

const BencodeDict& BencodeValue::as_dict() const {
    if (type_ != Type::Dictionary) {
        throw std::runtime_error("BencodeValue is not a dictionary");
    }
    return std::get<BencodeDict>(value_);
}

BencodeList& BencodeValue::as_list() {
    if (type_ != Type::List) {
        throw std::runtime_error("BencodeValue is not a list");
    }
    return std::get<BencodeList>(value_);
}

BencodeDict& BencodeValue::as_dict() {
    if (type_ != Type::Dictionary) {
        throw std::runtime_error("BencodeValue is not a dictionary");
    }
    return std::get<BencodeDict>(value_);
}

bool BencodeValue::has_key(const std::string& key) const {
    if (type_ != Type::Dictionary) {
        return false;
    }
    const auto& dict = std::get<BencodeDict>(value_);
    return dict.find(key) != dict.end();
}

const BencodeValue& BencodeValue::operator[](const std::string& key) const {
    const auto& dict = as_dict();
    auto it = dict.find(key);
    if (it == dict.end()) {
        throw std::runtime_error("Key not found in dictionary: " + key);
    }
    return it->second;
}

BencodeValue& BencodeValue::operator[](const std::string& key) {
    return as_dict()[key];
}

const BencodeValue& BencodeValue::operator[](size_t index) const {
    const auto& list = as_list();
    if (index >= list.size()) {
        throw std::runtime_error("Index out of bounds");
    }
    return list[index];
}

BencodeValue& BencodeValue::operator[](size_t index) {
    auto& list = as_list();
    if (index >= list.size()) {
        throw std::runtime_error("Index out of bounds");
    }
    return list[index];
}

void BencodeValue::push_back(const BencodeValue& value) {
    as_list().push_back(value);
}

void BencodeValue::push_back(BencodeValue&& value) {
    as_list().push_back(std::move(value));
}

size_t BencodeValue::size() const {
    switch (type_) {
        case Type::String:
            return std::get<std::string>(value_).size();
        case Type::List:
            return std::get<BencodeList>(value_).size();
        case Type::Dictionary:
            return std::get<BencodeDict>(value_).size();
        default:
            throw std::runtime_error("Size not applicable to this type");
    }
}

std::vector<uint8_t> BencodeValue::encode() const {
    std::vector<uint8_t> buffer;
    encode_to(buffer);
    return buffer;
}

std::string BencodeValue::encode_string() const {
    auto buffer = encode();
    return std::string(buffer.begin(), buffer.end());
}

static void append_byte_string(std::vector<uint8_t>& buffer, const std::string& str) {
    std::string len_str = std::to_string(str.size());
    buffer.insert(buffer.end(), len_str.begin(), len_str.end());
    buffer.push_back(':');
    buffer.insert(buffer.end(), str.begin(), str.end());
}

void BencodeValue::encode_to(std::vector<uint8_t>& buffer) const {
    switch (type_) {
        case Type::Integer: {
            // std::to_string never emits '+' or leading zeros
            std::string digits = std::to_string(std::get<int64_t>(value_));
            buffer.push_back('i');
            buffer.insert(buffer.end(), digits.begin(), digits.end());
            buffer.push_back('e');
            break;
        }
        case Type::String: {
            append_byte_string(buffer, std::get<std::string>(value_));
            break;
        }
        case Type::List: {
            buffer.push_back('l');
            for (const auto& item : std::get<BencodeList>(value_)) {
                item.encode_to(buffer);
            }
            buffer.push_back('e');
            break;
        }
        case Type::Dictionary: {
            const auto& dict = std::get<BencodeDict>(value_);

            // Keys in byte-wise order; char_traits<char> compares as unsigned char
            std::vector<const std::string*> keys;
            keys.reserve(dict.size());
            for (const auto& pair : dict) {
                keys.push_back(&pair.first);
            }
            std::sort(keys.begin(), keys.end(),
                [](const std::string* a, const std::string* b) { return *a < *b; });

            buffer.push_back('d');
            for (const std::string* key : keys) {
                append_byte_string(buffer, *key);
                dict.at(*key).encode_to(buffer);
            }
            buffer.push_back('e');
            break;
        }
    }
}

BencodeValue BencodeValue::create_list() {
    return BencodeValue(BencodeList());
}

BencodeValue BencodeValue::create_dict() {
    return BencodeValue(BencodeDict());
}

//=============================================================================
// BencodeDecoder
//=============================================================================

BencodeDecoder::BencodeDecoder(const uint8_t* data, size_t size)
    : data_(data), size_(size), pos_(0), depth_(0) {}

BencodeValue BencodeDecoder::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

BencodeValue BencodeDecoder::decode(const std::string& data) {
    return decode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

BencodeValue BencodeDecoder::decode(const uint8_t* data, size_t size) {
    BencodeDecoder decoder(data, size);
    BencodeValue value = decoder.decode_value();
    if (decoder.has_more()) {
        throw std::runtime_error("Trailing data after bencoded value");
    }
    return value;
}

BencodeValue BencodeDecoder::decode_value() {
    uint8_t first_byte = current_byte();

    if (first_byte == 'i') {
        return decode_integer();
    } else if (first_byte == 'l' || first_byte == 'd') {
        if (++depth_ > MAX_DEPTH) {
            throw std::runtime_error("Bencode nesting too deep");
        }
        BencodeValue value = (first_byte == 'l') ? decode_list() : decode_dict();
        --depth_;
        return value;
    } else if (first_byte >= '0' && first_byte <= '9') {
        return BencodeValue(decode_string_raw());
    }
    throw std::runtime_error("Invalid bencode data");
}

BencodeValue BencodeDecoder::decode_integer() {
    consume_byte(); // 'i'

    bool negative = false;
    if (current_byte() == '-') {
        negative = true;
        consume_byte();
    }

    size_t digits_start = pos_;
    uint64_t magnitude = 0;
    while (current_byte() != 'e') {
        uint8_t c = consume_byte();
        if (c < '0' || c > '9') {
            throw std::runtime_error("Invalid character in integer");
        }
        uint64_t digit = c - '0';
        if (magnitude > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw std::runtime_error("Integer overflow");
        }
        magnitude = magnitude * 10 + digit;
    }
    size_t digit_count = pos_ - digits_start;
    consume_byte(); // 'e'

    if (digit_count == 0) {
        throw std::runtime_error("Empty integer");
    }
    if (digit_count > 1 && data_[digits_start] == '0') {
        throw std::runtime_error("Integer has leading zero");
    }
    if (negative && magnitude == 0) {
        throw std::runtime_error("Negative zero is not allowed");
    }

    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (!negative) {
        if (magnitude > limit) {
            throw std::runtime_error("Integer overflow");
        }
        return BencodeValue(static_cast<int64_t>(magnitude));
    }
    if (magnitude > limit + 1) {
        throw std::runtime_error("Integer overflow");
    }
    if (magnitude == limit + 1) {
        return BencodeValue(std::numeric_limits<int64_t>::min());
    }
    return BencodeValue(-static_cast<int64_t>(magnitude));
}

std::string BencodeDecoder::decode_string_raw() {
    size_t digits_start = pos_;
    uint64_t length = 0;
    while (current_byte() != ':') {
        uint8_t c = consume_byte();
        if (c < '0' || c > '9') {
            throw std::runtime_error("Invalid string length");
        }
        length = length * 10 + (c - '0');
        if (length > size_) {
            throw std::runtime_error("String length exceeds data size");
        }
    }
    size_t digit_count = pos_ - digits_start;
    consume_byte(); // ':'

    if (digit_count == 0) {
        throw std::runtime_error("Empty string length");
    }
    if (digit_count > 1 && data_[digits_start] == '0') {
        throw std::runtime_error("String length has leading zero");
    }
    if (length > size_ - pos_) {
        throw std::runtime_error("String length exceeds data size");
    }

    std::string str(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(length));
    pos_ += static_cast<size_t>(length);
    return str;
}

BencodeValue BencodeDecoder::decode_list() {
    consume_byte(); // 'l'

    BencodeValue list = BencodeValue::create_list();
    while (current_byte() != 'e') {
        list.push_back(decode_value());
    }
    consume_byte();

    return list;
}

BencodeValue BencodeDecoder::decode_dict() {
    consume_byte(); // 'd'

    BencodeValue dict = BencodeValue::create_dict();
    bool have_previous = false;
    std::string previous_key;

    while (current_byte() != 'e') {
        uint8_t c = current_byte();
        if (c < '0' || c > '9') {
            throw std::runtime_error("Dictionary key must be a string");
        }
        std::string key = decode_string_raw();

        if (have_previous && !(previous_key < key)) {
            throw std::runtime_error("Dictionary keys not in canonical order: " + key);
        }

        dict.as_dict().emplace(key, decode_value());
        previous_key = std::move(key);
        have_previous = true;
    }
    consume_byte();

    return dict;
}

uint8_t BencodeDecoder::current_byte() const {
    if (pos_ >= size_) {
        throw std::runtime_error("Unexpected end of data");
    }
    return data_[pos_];
}

uint8_t BencodeDecoder::consume_byte() {
    if (pos_ >= size_) {
        throw std::runtime_error("Unexpected end of data");
    }
    return data_[pos_++];
}

//=============================================================================
// Utility functions
//=============================================================================

namespace bencode {
    BencodeValue decode(const std::vector<uint8_t>& data) {
        return BencodeDecoder::decode(data);
    }

    BencodeValue decode(const std::string& data) {
        return BencodeDecoder::decode(data);
    }

    std::vector<uint8_t> encode(const BencodeValue& value) {
        return value.encode();
    }

    std::string encode_string(const BencodeValue& value) {
        return value.encode_string();
    }

    bool is_canonical(const std::vector<uint8_t>& data) {
        try {
            return BencodeDecoder::decode(data).encode() == data;
        } catch (const std::runtime_error&) {
            return false;
        }
    }
}

} // namespace qtm
