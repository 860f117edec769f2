/*-------------------------------------------------------------------------
 *
 * CBsonType.cpp
 *      BSON document handling for the document wire protocol.
 *      Part of the DocWire document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "protocol/CBsonType.hpp"

#include <cstring>
#include <utility>

namespace DocWire
{

/* Smallest valid document: int32 length + terminating 0x00 */
static constexpr size_t MIN_DOCUMENT_SIZE = 5;

CBsonType::CBsonType()
    : bsonDoc_(nullptr), bsonArray_(nullptr), lastError_(), hasErrors_(false),
      inArray_(false), currentArrayKey_(), currentArrayIndex_(0)
{
    bsonDoc_ = bson_new();
    if (!bsonDoc_)
    {
        setError("Failed to create BSON document");
    }
}

CBsonType::~CBsonType()
{
    if (bsonArray_)
        bson_destroy(bsonArray_);
    if (bsonDoc_)
        bson_destroy(bsonDoc_);
}

CBsonType::CBsonType(const CBsonType& other)
    : bsonDoc_(other.bsonDoc_ ? bson_copy(other.bsonDoc_) : nullptr),
      bsonArray_(other.bsonArray_ ? bson_copy(other.bsonArray_) : nullptr),
      lastError_(other.lastError_), hasErrors_(other.hasErrors_),
      inArray_(other.inArray_), currentArrayKey_(other.currentArrayKey_),
      currentArrayIndex_(other.currentArrayIndex_)
{
}

CBsonType& CBsonType::operator=(const CBsonType& other)
{
    if (this != &other)
    {
        CBsonType tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

CBsonType::CBsonType(CBsonType&& other) noexcept
    : bsonDoc_(std::exchange(other.bsonDoc_, nullptr)),
      bsonArray_(std::exchange(other.bsonArray_, nullptr)),
      lastError_(std::move(other.lastError_)), hasErrors_(other.hasErrors_),
      inArray_(other.inArray_),
      currentArrayKey_(std::move(other.currentArrayKey_)),
      currentArrayIndex_(other.currentArrayIndex_)
{
    other.inArray_ = false;
    other.currentArrayIndex_ = 0;
}

CBsonType& CBsonType::operator=(CBsonType&& other) noexcept
{
    if (this != &other)
    {
        if (bsonArray_)
            bson_destroy(bsonArray_);
        if (bsonDoc_)
            bson_destroy(bsonDoc_);
        bsonDoc_ = std::exchange(other.bsonDoc_, nullptr);
        bsonArray_ = std::exchange(other.bsonArray_, nullptr);
        lastError_ = std::move(other.lastError_);
        hasErrors_ = other.hasErrors_;
        inArray_ = std::exchange(other.inArray_, false);
        currentArrayKey_ = std::move(other.currentArrayKey_);
        currentArrayIndex_ = std::exchange(other.currentArrayIndex_, 0);
    }
    return *this;
}

bool CBsonType::beginArray(const std::string& key)
{
    if (!checkBsonHandle())
        return false;
    if (inArray_)
    {
        setError("Nested arrays not supported in this builder");
        return false;
    }

    bsonArray_ = bson_new();
    if (!bsonArray_)
    {
        setError("Failed to create BSON array");
        return false;
    }
    inArray_ = true;
    currentArrayKey_ = key;
    currentArrayIndex_ = 0;
    return true;
}

bool CBsonType::endArray()
{
    if (!checkBsonHandle())
        return false;
    if (!inArray_)
    {
        setError("endArray called without beginArray");
        return false;
    }

    if (!bson_append_array(bsonDoc_, currentArrayKey_.c_str(), -1, bsonArray_))
    {
        setError("Failed to append array to document");
        return false;
    }

    resetArrayState();
    return true;
}

bool CBsonType::addString(const std::string& key, const std::string& value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_utf8(bsonDoc_, key.c_str(), -1, value.c_str(),
                          static_cast<int>(value.size())))
    {
        setError("Failed to add string");
        return false;
    }
    return true;
}

bool CBsonType::addInt32(const std::string& key, int32_t value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_int32(bsonDoc_, key.c_str(), -1, value))
    {
        setError("Failed to add int32");
        return false;
    }
    return true;
}

bool CBsonType::addInt64(const std::string& key, int64_t value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_int64(bsonDoc_, key.c_str(), -1, value))
    {
        setError("Failed to add int64");
        return false;
    }
    return true;
}

bool CBsonType::addDouble(const std::string& key, double value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_double(bsonDoc_, key.c_str(), -1, value))
    {
        setError("Failed to add double");
        return false;
    }
    return true;
}

bool CBsonType::addBool(const std::string& key, bool value)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_bool(bsonDoc_, key.c_str(), -1, value))
    {
        setError("Failed to add bool");
        return false;
    }
    return true;
}

bool CBsonType::addNull(const std::string& key)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_null(bsonDoc_, key.c_str(), -1))
    {
        setError("Failed to add null");
        return false;
    }
    return true;
}

bool CBsonType::addObjectId(const std::string& key, const std::string& objectId)
{
    bson_oid_t oid;

    if (!checkBsonHandle())
        return false;

    if (!bson_oid_is_valid(objectId.c_str(), objectId.length()))
    {
        setError("Invalid ObjectId format");
        return false;
    }
    bson_oid_init_from_string(&oid, objectId.c_str());

    if (!bson_append_oid(bsonDoc_, key.c_str(), -1, &oid))
    {
        setError("Failed to add ObjectId");
        return false;
    }
    return true;
}

bool CBsonType::addDateTime(const std::string& key, int64_t timestamp)
{
    if (!checkBsonHandle())
        return false;

    if (!bson_append_date_time(bsonDoc_, key.c_str(), -1, timestamp))
    {
        setError("Failed to add datetime");
        return false;
    }
    return true;
}

bool CBsonType::addDocument(const std::string& key, const CBsonType& subdoc)
{
    if (!checkBsonHandle())
        return false;
    if (!subdoc.getBsonHandle())
    {
        setError("Subdocument handle is null");
        return false;
    }

    if (!bson_append_document(bsonDoc_, key.c_str(), -1, subdoc.getBsonHandle()))
    {
        setError("Failed to add subdocument");
        return false;
    }
    return true;
}

std::string CBsonType::nextArrayIndexKey()
{
    return std::to_string(currentArrayIndex_++);
}

bool CBsonType::addArrayString(const std::string& value)
{
    if (!inArray_ || !bsonArray_)
    {
        setError("addArrayString used outside array");
        return false;
    }
    std::string k = nextArrayIndexKey();
    if (!bson_append_utf8(bsonArray_, k.c_str(), -1, value.c_str(),
                          static_cast<int>(value.size())))
    {
        setError("Failed to add array string");
        return false;
    }
    return true;
}

bool CBsonType::addArrayInt32(int32_t value)
{
    if (!inArray_ || !bsonArray_)
    {
        setError("addArrayInt32 used outside array");
        return false;
    }
    std::string k = nextArrayIndexKey();
    if (!bson_append_int32(bsonArray_, k.c_str(), -1, value))
    {
        setError("Failed to add array int32");
        return false;
    }
    return true;
}

bool CBsonType::addArrayInt64(int64_t value)
{
    if (!inArray_ || !bsonArray_)
    {
        setError("addArrayInt64 used outside array");
        return false;
    }
    std::string k = nextArrayIndexKey();
    if (!bson_append_int64(bsonArray_, k.c_str(), -1, value))
    {
        setError("Failed to add array int64");
        return false;
    }
    return true;
}

bool CBsonType::addArrayDocument(const CBsonType& subdoc)
{
    if (!inArray_ || !bsonArray_)
    {
        setError("addArrayDocument used outside array");
        return false;
    }
    if (!subdoc.getBsonHandle())
    {
        setError("Array subdocument handle is null");
        return false;
    }
    std::string k = nextArrayIndexKey();
    if (!bson_append_document(bsonArray_, k.c_str(), -1,
                              subdoc.getBsonHandle()))
    {
        setError("Failed to add array document");
        return false;
    }
    return true;
}

std::vector<uint8_t> CBsonType::getDocument() const
{
    if (!bsonDoc_)
        return {};

    const uint8_t* data = bson_get_data(bsonDoc_);
    return std::vector<uint8_t>(data, data + bsonDoc_->len);
}

const bson_t* CBsonType::getBsonHandle() const
{
    return bsonDoc_;
}

bool CBsonType::parseDocument(const std::vector<uint8_t>& data)
{
    return parseDocument(data.data(), data.size());
}

bool CBsonType::parseDocument(const uint8_t* data, size_t size)
{
    bson_t* parsed;

    if (!data || size < MIN_DOCUMENT_SIZE)
    {
        setError("Invalid data or size");
        return false;
    }

    parsed = bson_new_from_data(data, size);
    if (!parsed)
    {
        setError("Failed to parse BSON data");
        return false;
    }
    if (!bson_validate(parsed, BSON_VALIDATE_NONE, nullptr))
    {
        bson_destroy(parsed);
        setError("BSON data failed validation");
        return false;
    }

    if (bsonDoc_)
        bson_destroy(bsonDoc_);
    bsonDoc_ = parsed;
    lastError_.clear();
    hasErrors_ = false;
    resetArrayState();
    return true;
}

bool CBsonType::parseJson(const std::string& json)
{
    bson_error_t error;
    bson_t* parsed;

    parsed = bson_new_from_json(reinterpret_cast<const uint8_t*>(json.data()),
                                static_cast<ssize_t>(json.size()), &error);
    if (!parsed)
    {
        setError(std::string("Invalid JSON document: ") + error.message);
        return false;
    }

    if (bsonDoc_)
        bson_destroy(bsonDoc_);
    bsonDoc_ = parsed;
    lastError_.clear();
    hasErrors_ = false;
    resetArrayState();
    return true;
}

std::optional<CBsonType> CBsonType::decode(const uint8_t* data,
                                           size_t available, size_t& consumed)
{
    uint32_t declared;
    CBsonType doc;

    consumed = 0;
    if (!data || available < MIN_DOCUMENT_SIZE)
        return std::nullopt;

    std::memcpy(&declared, data, sizeof(declared));
    declared = BSON_UINT32_FROM_LE(declared);
    if (declared < MIN_DOCUMENT_SIZE || declared > available)
        return std::nullopt;

    if (!doc.parseDocument(data, declared))
        return std::nullopt;

    consumed = declared;
    return doc;
}

std::optional<CBsonType> CBsonType::fromJson(const std::string& json)
{
    CBsonType doc;
    if (!doc.parseJson(json))
        return std::nullopt;
    return doc;
}

std::string CBsonType::toJson() const
{
    if (!bsonDoc_)
        return std::string();

    size_t len = 0;
    char* json = bson_as_canonical_extended_json(bsonDoc_, &len);
    if (!json)
    {
        setError("Failed to convert to canonical JSON");
        return std::string();
    }
    std::string s(json, len);
    bson_free(json);
    return s;
}

std::string CBsonType::toJsonRelaxed() const
{
    if (!bsonDoc_)
        return std::string();

    size_t len = 0;
    char* json = bson_as_relaxed_extended_json(bsonDoc_, &len);
    if (!json)
    {
        setError("Failed to convert to relaxed JSON");
        return std::string();
    }
    std::string s(json, len);
    bson_free(json);
    return s;
}

bool CBsonType::hasField(const std::string& key) const
{
    return bsonDoc_ && bson_has_field(bsonDoc_, key.c_str());
}

std::optional<std::string> CBsonType::getString(const std::string& key) const
{
    bson_iter_t iter;
    uint32_t len = 0;

    if (!bsonDoc_ || !bson_iter_init_find(&iter, bsonDoc_, key.c_str()) ||
        !BSON_ITER_HOLDS_UTF8(&iter))
        return std::nullopt;

    const char* value = bson_iter_utf8(&iter, &len);
    return std::string(value, len);
}

std::optional<int32_t> CBsonType::getInt32(const std::string& key) const
{
    bson_iter_t iter;

    if (!bsonDoc_ || !bson_iter_init_find(&iter, bsonDoc_, key.c_str()) ||
        !BSON_ITER_HOLDS_INT32(&iter))
        return std::nullopt;
    return bson_iter_int32(&iter);
}

std::optional<int64_t> CBsonType::getInt64(const std::string& key) const
{
    bson_iter_t iter;

    if (!bsonDoc_ || !bson_iter_init_find(&iter, bsonDoc_, key.c_str()))
        return std::nullopt;
    if (BSON_ITER_HOLDS_INT64(&iter))
        return bson_iter_int64(&iter);
    if (BSON_ITER_HOLDS_INT32(&iter))
        return bson_iter_int32(&iter);
    return std::nullopt;
}

size_t CBsonType::fieldCount() const
{
    if (!bsonDoc_)
        return 0;
    return static_cast<size_t>(bson_count_keys(bsonDoc_));
}

size_t CBsonType::getDocumentSize() const
{
    if (!bsonDoc_)
        return 0;
    return bsonDoc_->len;
}

void CBsonType::clear()
{
    resetArrayState();
    if (bsonDoc_)
        bson_destroy(bsonDoc_);

    bsonDoc_ = bson_new();
    lastError_.clear();
    hasErrors_ = false;
}

bool CBsonType::isEmpty() const
{
    if (!bsonDoc_)
        return true;

    // Empty BSON document is 5 bytes
    return bsonDoc_->len == MIN_DOCUMENT_SIZE;
}

std::string CBsonType::getLastError() const
{
    return lastError_;
}

bool CBsonType::hasErrors() const
{
    return hasErrors_;
}

bool CBsonType::operator==(const CBsonType& other) const
{
    if (!bsonDoc_ || !other.bsonDoc_)
        return bsonDoc_ == other.bsonDoc_;
    return bson_equal(bsonDoc_, other.bsonDoc_);
}

void CBsonType::setError(const std::string& error) const
{
    lastError_ = error;
    hasErrors_ = true;
}

bool CBsonType::checkBsonHandle() const
{
    return bsonDoc_ != nullptr && !hasErrors_;
}

void CBsonType::resetArrayState()
{
    if (bsonArray_)
    {
        bson_destroy(bsonArray_);
        bsonArray_ = nullptr;
    }
    inArray_ = false;
    currentArrayKey_.clear();
    currentArrayIndex_ = 0;
}

} // namespace DocWire
