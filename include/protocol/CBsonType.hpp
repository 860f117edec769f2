/*-------------------------------------------------------------------------
 *
 * CBsonType.hpp
 *      BSON document wrapper used as the document payload of every
 *      DocWire message.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <bson/bson.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocWire
{

class CBsonType
{
  public:
    CBsonType();
    ~CBsonType();

    CBsonType(const CBsonType& other);
    CBsonType& operator=(const CBsonType& other);
    CBsonType(CBsonType&& other) noexcept;
    CBsonType& operator=(CBsonType&& other) noexcept;

    bool beginArray(const std::string& key);
    bool endArray();

    bool addString(const std::string& key, const std::string& value);
    bool addInt32(const std::string& key, int32_t value);
    bool addInt64(const std::string& key, int64_t value);
    bool addDouble(const std::string& key, double value);
    bool addBool(const std::string& key, bool value);
    bool addNull(const std::string& key);
    bool addObjectId(const std::string& key, const std::string& objectId);
    bool addDateTime(const std::string& key, int64_t timestamp);
    bool addDocument(const std::string& key, const CBsonType& subdoc);

    // Array element adders, valid only between beginArray/endArray
    bool addArrayString(const std::string& value);
    bool addArrayInt32(int32_t value);
    bool addArrayInt64(int64_t value);
    bool addArrayDocument(const CBsonType& subdoc);

    /* Encoded bytes of the document, length prefix included */
    std::vector<uint8_t> getDocument() const;
    const bson_t* getBsonHandle() const;

    bool parseDocument(const std::vector<uint8_t>& data);
    bool parseDocument(const uint8_t* data, size_t size);
    bool parseJson(const std::string& json);

    /*
     * Decode one document from the front of data. On success consumed
     * holds the document's declared length. Returns nullopt when the
     * length prefix is missing, below the 5-byte minimum, larger than
     * available, or the bytes are not a valid document.
     */
    static std::optional<CBsonType> decode(const uint8_t* data,
                                           size_t available, size_t& consumed);
    static std::optional<CBsonType> fromJson(const std::string& json);

    std::string toJson() const;        // canonical extended JSON
    std::string toJsonRelaxed() const; // relaxed extended JSON

    bool hasField(const std::string& key) const;
    std::optional<std::string> getString(const std::string& key) const;
    std::optional<int32_t> getInt32(const std::string& key) const;
    std::optional<int64_t> getInt64(const std::string& key) const;
    size_t fieldCount() const;

    size_t getDocumentSize() const;

    void clear();
    bool isEmpty() const;

    std::string getLastError() const;
    bool hasErrors() const;

    bool operator==(const CBsonType& other) const;

  private:
    std::string nextArrayIndexKey();
    bool checkBsonHandle() const;
    void setError(const std::string& error) const;
    void resetArrayState();

  private:
    bson_t* bsonDoc_;
    bson_t* bsonArray_;

    mutable std::string lastError_;
    mutable bool hasErrors_;
    bool inArray_;
    std::string currentArrayKey_;
    size_t currentArrayIndex_;
};

} // namespace DocWire
