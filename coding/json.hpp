#pragma once

#include "base/exception.hpp"

#define RAPIDJSON_SSE2 1
#define RAPIDJSON_HAS_STDSTRING 1
#define RAPIDJSON_HAS_CXX11_TYPETRAITS 1

#include <rapidjson/document.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace coding
{
DECLARE_EXCEPTION(JsonException, RootException);

using JsonValue = rapidjson::Value;
using JsonDocument = rapidjson::Document;
using JsonAllocator = rapidjson::Document::AllocatorType;
using JsonParseResult = rapidjson::ParseResult;

inline void FromJson(JsonValue const & root, double & result)
{
  if (!root.IsNumber())
    MYTHROW(coding::JsonException, ("Object must contain a json number."));
  result = root.GetDouble();
}

inline void FromJson(JsonValue const & root, std::string & result)
{
  if (!root.IsString())
    MYTHROW(coding::JsonException, ("The field must contain a json string."));
  result = root.GetString();
}

template <typename T>
void FromJson(JsonValue const & root, std::vector<T> & result)
{
  if (!root.IsArray())
    MYTHROW(coding::JsonException, ("The field must contain a json array."));
  result.clear();
  result.reserve(root.Size());
  for (auto const & item : root.GetArray())
  {
    T value{};
    FromJson(item, value);
    result.push_back(std::move(value));
  }
}

// Parses |jsonStr| into |document|, throws JsonException on malformed input.
inline void ParseJson(std::string const & jsonStr, JsonDocument & document)
{
  JsonParseResult const ok = document.Parse(jsonStr.c_str(), jsonStr.size());
  if (!ok)
  {
    MYTHROW(coding::JsonException,
            ("Malformed json at offset", ok.Offset(), "error code", static_cast<int>(ok.Code())));
  }
}

static const coding::JsonValue nullValue;

inline coding::JsonValue const & GetJsonOptionalField(coding::JsonValue const & root,
                                                      std::string const & field)
{
  if (!root.IsObject())
    MYTHROW(coding::JsonException, ("Bad json object while parsing", field));

  coding::JsonValue::ConstMemberIterator it = root.FindMember(field);

  if (it == root.MemberEnd())
    return nullValue;

  return it->value;
}

inline coding::JsonValue const & GetJsonObligatoryField(coding::JsonValue const & root,
                                                        std::string const & field)
{
  coding::JsonValue const & value = GetJsonOptionalField(root, field);
  if (value.IsNull())
    MYTHROW(coding::JsonException, ("Obligatory field", field, "is absent."));

  return value;
}

template <typename T>
void FromJsonObjectOptionalField(JsonValue const & root, std::string const & field, T & result)
{
  coding::JsonValue const & value = GetJsonOptionalField(root, field);

  if (value.IsNull())
  {
    result = T{};
    return;
  }
  FromJson(value, result);
}

template <typename T>
void FromJsonObject(JsonValue const & root, std::string const & field, T & result)
{
  FromJson(GetJsonObligatoryField(root, field), result);
}

inline JsonValue MakeJsonString(std::string const & s, JsonAllocator & allocator)
{
  return JsonValue(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

template <typename Stream>
class JsonCustomPrecisionWriter : public rapidjson::Writer<Stream>
{
public:
  // 6 digits after comma. Nautical mile is good approximation for one angle minute, so we can rely,
  // that final precision is 60 (minutes in degree) * 1852 (meters in one mile)
  // 1000000 = 0.111 = 111 millimeters.

  static uint32_t constexpr kDefaultPrecision = 6;
  JsonCustomPrecisionWriter(Stream & stream, size_t precision = kDefaultPrecision)
        : rapidjson::Writer<Stream>(stream)
        , m_precision(precision)
  {
  }

  bool Double(double d)
  {
    this->Prefix(rapidjson::kNumberType);
    std::stringstream ss;
    ss << std::fixed << std::setprecision(m_precision) << d;
    std::string number = ss.str();

    for (char c : number)
      this->os_->Put(c);

    return true;
  }

private:
  size_t m_precision = kDefaultPrecision;
};

// Serializes |value| into one line, doubles are written with |precision| fractional digits.
inline std::string SerializeJson(JsonValue const & value,
                                 size_t precision = JsonCustomPrecisionWriter<
                                     rapidjson::StringBuffer>::kDefaultPrecision)
{
  rapidjson::StringBuffer buffer;
  JsonCustomPrecisionWriter<rapidjson::StringBuffer> writer(buffer, precision);
  value.Accept(writer);
  return buffer.GetString();
}
}  // namespace coding
