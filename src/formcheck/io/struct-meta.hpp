#pragma once

#include <any>

#include "formcheck/io/json-io.hpp"
#include "formcheck/utils/file-system.hpp"
#include "formcheck/utils/string-utils.hpp"
#include "json/json.h"

/**
 * Example Usage

struct Sampling final : public MetaCompatible
{
   int stride    = 3;
   bool keep_all = false;
   string label  = "sampling"s;

   const vector<MemberMetaData>& meta_data() const noexcept override;
};

//
// In cpp file
//
const vector<MemberMetaData>& Sampling::meta_data() const noexcept
{
   auto make_it = []() {
      vector<MemberMetaData> M;
      M.push_back(MAKE_META(Sampling, INT, stride, true));
      M.push_back(MAKE_META(Sampling, BOOL, keep_all, true));
      M.push_back(MAKE_META(Sampling, STRING, label, true));
      return M;
   };
   static vector<MemberMetaData> meta = make_it();
   return meta;
}

//
// Now we have:
//
void some_fun()
{
   Sampling x;
   Json::Value o = x.to_json();
   cout << str(x) << endl;
   x.read(o);
}

*/

namespace formcheck
{
// ------------------------------------------------------------------- meta-type
//
enum class meta_type : int { BOOL = 0, INT, STRING };

// -------------------------------------------------------------- MemberMetaData
//
struct MemberMetaData
{
   using get_fun = std::function<std::any(const void*)>;
   using set_fun = std::function<void(void*, const std::any&)>;

 private:
   meta_type type_       = meta_type::BOOL;
   get_fun getter_       = nullptr;
   set_fun setter_       = nullptr;
   std::string name_     = ""s;
   bool important_in_eq_ = true;

 public:
   MemberMetaData(meta_type t,
                  string name,
                  bool eq,
                  get_fun gf,
                  set_fun sf) noexcept;

   // `o` always points to the most derived object
   template<typename T1, typename T2>
   MemberMetaData(meta_type t, string name, bool eq, T1 T2::*member)
       : MemberMetaData(
           t,
           std::move(name),
           eq,
           [member](const void* o) -> std::any {
              return std::any(static_cast<const T2*>(o)->*member);
           },
           [member](void* o, const std::any& val) {
              static_cast<T2*>(o)->*member = std::any_cast<T1>(val);
           })
   {}

   // Getters
   meta_type type() const noexcept { return type_; }
   const string& name() const noexcept { return name_; }
   bool important_in_eq() const noexcept { return important_in_eq_; }

   // Operations
   bool eq(const void* u, const void* v) const noexcept(false);
   Json::Value to_json(const void* u) const noexcept(false);
   void read(void* x, const Json::Value& o) const noexcept(false);
};

#define MAKE_META(clazz, type, member, eq)            \
   {                                                  \
      meta_type::type, #member##s, eq, &clazz::member \
   }

// ------------------------------------------------------------- Meta Compatible
//
struct MetaCompatible
{
 public:
   virtual ~MetaCompatible() {}

   virtual const vector<MemberMetaData>& meta_data() const noexcept = 0;

   bool operator==(const MetaCompatible& o) const noexcept;
   bool operator!=(const MetaCompatible& o) const noexcept;
   string to_string() const noexcept;
   string to_json_string() const noexcept;
   Json::Value to_json() const noexcept;
   void read(const Json::Value& val) noexcept(false);

   // Missing or malformed keys are taken from `defaults`. Throws if
   // `defaults` is nullptr and a key is missing or malformed.
   void read_with_defaults(const Json::Value& val,
                           const MetaCompatible* defaults,
                           const bool print_warnings = true,
                           const string_view path    = ""s) noexcept(false);

   // read_with_defaults<Params>(json_object);
   template<typename T>
   void read_with_defaults(const Json::Value& val,
                           const bool print_warnings = true,
                           const string_view path    = ""s) noexcept(false)
   {
      T defaults;
      read_with_defaults(val, &defaults, print_warnings, path);
   }

   friend string str(const MetaCompatible& o) noexcept { return o.to_string(); }
};

#define META_READ_WRITE_LOAD_SAVE(TYPE_)                                    \
   inline void read(TYPE_& data, const Json::Value& node) noexcept(false)   \
   {                                                                        \
      TYPE_ defaults;                                                       \
      data.read_with_defaults(node, &defaults);                             \
   }                                                                        \
   inline void read(TYPE_& data, const std::string& in) noexcept(false)     \
   {                                                                        \
      read(data, parse_json(in));                                           \
   }                                                                        \
   inline void write(const TYPE_& data, std::string& out) noexcept(false)   \
   {                                                                        \
      out = data.to_json_string();                                          \
   }                                                                        \
   inline void write(const TYPE_& data, Json::Value& node) noexcept(false)  \
   {                                                                        \
      node = data.to_json();                                                \
   }                                                                        \
   inline void load(TYPE_& data, const string& fname) noexcept(false)       \
   {                                                                        \
      read(data, file_get_contents(fname));                                 \
   }                                                                        \
   inline void save(const TYPE_& data, const string& fname) noexcept(false) \
   {                                                                        \
      std::string s;                                                        \
      write(data, s);                                                       \
      const auto ec = file_put_contents(fname, s);                          \
      if(ec)                                                                \
         throw std::runtime_error(                                          \
             format("failed to write '{}': {}", fname, ec.message()));      \
   }

} // namespace formcheck
