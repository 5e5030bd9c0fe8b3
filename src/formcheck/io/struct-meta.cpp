#include "struct-meta.hpp"

#include "formcheck/io/json-io.hpp"

#define This MemberMetaData

namespace formcheck
{
// ---------------------------------------------------------------- construction
//
This::This(meta_type t,
           std::string member_name,
           bool eq,
           get_fun gf,
           set_fun sf) noexcept
    : type_(t)
    , getter_(std::move(gf))
    , setter_(std::move(sf))
    , name_(std::move(member_name))
    , important_in_eq_(eq)
{
   Expects(getter_ != nullptr);
   Expects(setter_ != nullptr);
}

// -------------------------------------------------------------------------- eq
//
bool This::eq(const void* u, const void* v) const noexcept(false)
{
   if(!important_in_eq_) return true;
#define CASE_1(TYPE, t)                   \
   case meta_type::TYPE:                  \
      return std::any_cast<t>(getter_(u)) \
             == std::any_cast<t>(getter_(v))

   switch(type_) {
      CASE_1(BOOL, bool);
      CASE_1(INT, int);
      CASE_1(STRING, string);
   }

#undef CASE_1
   return false;
}

// --------------------------------------------------------------------- to_json
//
Json::Value This::to_json(const void* x) const noexcept(false)
{
#define CASE(TYPE, t) \
   case meta_type::TYPE: return json_save(std::any_cast<t>(getter_(x)))

   switch(type_) {
      CASE(BOOL, bool);
      CASE(INT, int);
      CASE(STRING, string);
   }
#undef CASE
   return Json::Value{Json::nullValue};
}

// ------------------------------------------------------------------- read_json
//
template<typename T> T load_T(const Json::Value& node)
{
   T x;
   json_load(node, x);
   return x;
}

void This::read(void* x, const Json::Value& o) const noexcept(false)
{
#define CASE(TYPE, t) \
   case meta_type::TYPE: setter_(x, std::any(load_T<t>(o))); break;

   switch(type_) {
      CASE(BOOL, bool);
      CASE(INT, int);
      CASE(STRING, string);
   }
#undef CASE
}

// ------------------------------------------------------------ detail functions
//
namespace detail
{
   static bool eq_with_meta(const vector<MemberMetaData>& meta_data,
                            const void* a,
                            const void* b) noexcept
   {
      if(a == b) return true;
      try {
         for(const auto& m : meta_data)
            if(!m.eq(a, b)) return false;
         return true;
      } catch(std::bad_any_cast& e) {
         LOG_ERR(format("bad any cast comparing objects: {}", e.what()));
      }
      return false;
   }

   static Json::Value to_json_with_meta(const vector<MemberMetaData>& meta_data,
                                        const void* x) noexcept
   {
      Json::Value o{Json::objectValue};
      try {
         for(const auto& m : meta_data) {
            Expects(!has_key(o, m.name()));
            o[m.name()] = m.to_json(x);
         }
      } catch(std::bad_any_cast& e) {
         FATAL(format("bad any cast writing json: {}", e.what()));
      }
      return o;
   }

   static void read_json_with_meta(const vector<MemberMetaData>& meta_data,
                                   void* x,
                                   const Json::Value& o) noexcept(false)
   {
      for(const auto& m : meta_data) {
         if(!has_key(o, m.name()))
            throw std::runtime_error(
                format("failed to find key '{}'", m.name()));
         m.read(x, o[m.name()]);
      }
   }

   static void
   read_json_with_meta_and_defaults(const vector<MemberMetaData>& meta_data,
                                    void* x,
                                    const Json::Value& o,
                                    const void* defaults,
                                    const string_view path,
                                    const bool print_warnings) noexcept(false)
   {
      auto get_path = [&](const string_view name) {
         const char* delim = (path.size() == 0) ? "" : ".";
         return format("{}{}{}", path, delim, name);
      };

      for(const auto& m : meta_data) {
         string reason = ""s;
         if(!has_key(o, m.name())) {
            reason = "missing key"s;
         } else {
            try {
               m.read(x, o[m.name()]);
            } catch(std::exception& e) {
               reason = e.what();
            }
         }

         if(reason.empty()) continue;

         if(defaults == nullptr)
            throw std::runtime_error(
                format("error reading '{}': {}", get_path(m.name()), reason));

         m.read(x, m.to_json(defaults));

         if(print_warnings and !k_is_testcase_build)
            WARN(format("using default value for '{}' ({})",
                        get_path(m.name()),
                        reason));
      }
   }

} // namespace detail

// -------------------------------------------------- MetaCompatible::operator==
//
bool MetaCompatible::operator==(const MetaCompatible& o) const noexcept
{
   if(this == &o) return true;
   const auto& A = meta_data();
   const auto& B = o.meta_data();
   if(&A != &B) return false;
   return detail::eq_with_meta(
       A, dynamic_cast<const void*>(this), dynamic_cast<const void*>(&o));
}

bool MetaCompatible::operator!=(const MetaCompatible& o) const noexcept
{
   return !(*this == o);
}

string MetaCompatible::to_json_string() const noexcept
{
   return json_pretty_str(to_json());
}

string MetaCompatible::to_string() const noexcept { return to_json_string(); }

Json::Value MetaCompatible::to_json() const noexcept
{
   return detail::to_json_with_meta(this->meta_data(),
                                    dynamic_cast<const void*>(this));
}

void MetaCompatible::read(const Json::Value& val) noexcept(false)
{
   detail::read_json_with_meta(
       this->meta_data(), dynamic_cast<void*>(this), val);
}

void MetaCompatible::read_with_defaults(const Json::Value& val,
                                        const MetaCompatible* defaults,
                                        const bool print_warnings,
                                        const string_view path) noexcept(false)
{
   if(defaults != nullptr and &defaults->meta_data() != &meta_data())
      throw std::logic_error("defaults must have the same type");
   detail::read_json_with_meta_and_defaults(
       this->meta_data(),
       dynamic_cast<void*>(this),
       val,
       (defaults == nullptr) ? nullptr : dynamic_cast<const void*>(defaults),
       path,
       print_warnings);
}

} // namespace formcheck

#undef This
