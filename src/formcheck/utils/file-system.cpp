#include "file-system.hpp"

#include "formcheck/foundation.hpp"

#include <filesystem>

namespace formcheck
{
bool is_regular_file(const std::string_view filename) noexcept
{
   std::error_code ec;
   const bool ret = std::filesystem::is_regular_file(
       std::filesystem::path(filename), ec);
   return !ec and ret;
}

bool is_directory(const std::string_view filename) noexcept
{
   std::error_code ec;
   const bool ret
       = std::filesystem::is_directory(std::filesystem::path(filename), ec);
   return !ec and ret;
}

// ----------------------------------------------------------- file-get-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& data) noexcept
{
   const string path{fname};
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(path.c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });

   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   if(fseek(fp.get(), 0, SEEK_END) == -1) {
      // Probably EBADF: stream was not seekaable
      return std::make_error_code(std::errc(errno));
   }

   auto fpos = ftell(fp.get());
   if(fpos == -1) return std::make_error_code(std::errc(errno));

   auto sz = size_t(fpos < 0 ? 0 : fpos);

   try {
      data.resize(sz);
   } catch(std::length_error& e) {
      return std::make_error_code(std::errc::invalid_argument);
   } catch(std::bad_alloc& e) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(fseek(fp.get(), 0, SEEK_SET) == -1)
      return std::make_error_code(std::errc(errno));

   if(sz > 0 and data.size() != fread(&data[0], 1, data.size(), fp.get())) {
      if(ferror(fp.get())) return std::make_error_code(std::errc(errno));
      return std::make_error_code(std::errc::io_error);
   }

   if(FILE* ptr = fp.release(); fclose(ptr) != 0)
      return std::make_error_code(std::errc(errno));

   return {};
}

std::string file_get_contents(const std::string_view fname) noexcept(false)
{
   std::string out;
   const auto ec = file_get_contents(fname, out);
   if(ec)
      throw std::runtime_error(
          format("failed to read '{}': {}", fname, ec.message()));
   return out;
}

// ----------------------------------------------------------- file-put-contents

error_code file_put_contents(const std::string_view filename,
                             const std::string_view dat) noexcept
{
   const string path{filename};
   FILE* fp = fopen(path.c_str(), "wb");
   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   error_code ec = {};

   auto sz = fwrite(dat.data(), 1, dat.size(), fp);
   if(sz != dat.size()) {
      if(ferror(fp))
         ec = std::make_error_code(std::errc(errno));
      else
         ec = std::make_error_code(std::errc::io_error);
   }
   if(fclose(fp) != 0)
      if(!ec) ec = make_error_code(std::errc(errno));

   return ec;
}

// ----------------------------------------------------------------- delete-file

std::error_code delete_file(const std::string_view path) noexcept
{
   namespace fs = std::filesystem;
   std::error_code ec;
   fs::remove(fs::path(path), ec);
   return ec;
}

// --------------------------------------------------------------- basename/etc

std::string basename(const std::string_view filename,
                     const bool strip_extension) noexcept
{
   const auto p = std::filesystem::path(filename);
   return strip_extension ? p.stem().string() : p.filename().string();
}

std::string file_ext(const std::string_view filename) noexcept
{
   return std::filesystem::path(filename).extension().string();
}

} // namespace formcheck
