#pragma once

#include "json/json.h"

#include "formcheck/foundation.hpp"

namespace formcheck
{
void json_load(const Json::Value& node, bool&);
void json_load(const Json::Value& node, int&);
void json_load(const Json::Value& node, std::string&);

double load_numeric(const Json::Value& elem) noexcept(false);

Json::Value json_save(const bool&);
Json::Value json_save(const int&);
Json::Value json_save(const double&);
Json::Value json_save(const string&);

template<typename InputIt>
inline Json::Value json_save(InputIt cbegin, InputIt cend)
{
   Json::Value x{Json::arrayValue};
   x.resize(unsigned(std::distance(cbegin, cend)));
   for(auto i = 0u; i < x.size(); ++i) x[i] = json_save(*cbegin++);
   return x;
}

/**
 * For example,
 *
 *      unsigned width{10};
 *      node["width"] = width;
 *      // ...
 *      json_load(get_key(node, "width"), width);
 *
 */
Json::Value get_key(const Json::Value& node, const char* key);

inline Json::Value get_key(const Json::Value& node, const string_view& key)
{
   return get_key(node, string(key).c_str());
}

inline bool has_key(const Json::Value& node, const string_view& key)
{
   if(node.type() != Json::objectValue) return false;
   return node.isMember(string(key));
}

Json::Value parse_json(const string& s) noexcept(false); // that-is throws

// Pretty printed, as written to result files
string json_pretty_str(const Json::Value& o) noexcept;

inline string str(const Json::Value& o) noexcept
{
   std::stringstream ss{""s};
   ss << o;
   return ss.str();
}

} // namespace formcheck
