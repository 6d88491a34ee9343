//
// ... Standard header files
//
#include <algorithm>
#include <stdexcept>
#include <string>

//
// ... External header files
//
#include <miniz.h>

//
// ... npzkit header files
//
#include <npzkit/data/errors.hpp>
#include <npzkit/data/zip.hpp>

namespace npzkit::data::detail {

  namespace {

    std::string
    last_error(mz_zip_archive& zip)
    {
      return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
    }

    // Ends a miniz reader or writer on every exit path.
    class Zip_reader_guard final {
    public:
      explicit Zip_reader_guard(mz_zip_archive& zip)
          : zip_(zip)
      {}

      Zip_reader_guard(Zip_reader_guard const&) = delete;
      Zip_reader_guard&
      operator=(Zip_reader_guard const&) = delete;

      ~Zip_reader_guard() { mz_zip_reader_end(&zip_); }

    private:
      mz_zip_archive& zip_;

    }; // end of class Zip_reader_guard

    class Zip_writer_guard final {
    public:
      explicit Zip_writer_guard(mz_zip_archive& zip)
          : zip_(zip)
      {}

      Zip_writer_guard(Zip_writer_guard const&) = delete;
      Zip_writer_guard&
      operator=(Zip_writer_guard const&) = delete;

      ~Zip_writer_guard() { mz_zip_writer_end(&zip_); }

    private:
      mz_zip_archive& zip_;

    }; // end of class Zip_writer_guard

    Npz_archive
    read_members(mz_zip_archive& zip)
    {
      Npz_archive archive;
      auto const count = mz_zip_reader_get_num_files(&zip);
      for (mz_uint index = 0; index < count; ++index) {
        mz_zip_archive_file_stat stat{};
        if (!mz_zip_reader_file_stat(&zip, index, &stat)) {
          throw Zip_error("bad central directory entry: " + last_error(zip));
        }

        std::string name{stat.m_filename};
        if (stat.m_is_encrypted) {
          throw Zip_error("member '" + name + "' is encrypted");
        }
        if (!stat.m_is_supported) {
          throw Zip_error("unsupported compression method " + std::to_string(stat.m_method) +
                          " for member '" + name + "'");
        }
        if (stat.m_uncomp_size > std::string{}.max_size()) {
          throw Zip_error("member '" + name + "' is too large");
        }

        auto const names = archive.member_names();
        if (std::find(names.begin(), names.end(), name) != names.end()) {
          throw Zip_error("duplicate member '" + name + "'");
        }

        std::string data(static_cast<std::size_t>(stat.m_uncomp_size), '\0');
        if (!mz_zip_reader_extract_to_mem(&zip, index, data.data(), data.size(), 0)) {
          throw Zip_error("cannot extract member '" + name + "': " + last_error(zip));
        }

        archive.insert_member(std::move(name), std::move(data));
      }
      return archive;
    }

    void
    write_members(mz_zip_archive& zip, Npz_archive const& archive)
    {
      for (auto const& name : archive.member_names()) {
        auto const& data = archive.member(name);
        if (!mz_zip_writer_add_mem(&zip, name.c_str(), data.data(), data.size(),
                                   MZ_NO_COMPRESSION)) {
          throw Zip_error("cannot add member '" + name + "': " + last_error(zip));
        }
      }
    }

  } // end of anonymous namespace

  Npz_archive
  parse_zip(std::string_view bytes)
  {
    mz_zip_archive zip{};
    if (!mz_zip_reader_init_mem(&zip, bytes.data(), bytes.size(), 0)) {
      throw Zip_error("not a zip archive: " + last_error(zip));
    }
    Zip_reader_guard guard{zip};
    return read_members(zip);
  }

  std::string
  format_zip(Npz_archive const& archive)
  {
    mz_zip_archive zip{};
    if (!mz_zip_writer_init_heap(&zip, 0, 0)) {
      throw Zip_error("cannot start archive: " + last_error(zip));
    }
    Zip_writer_guard guard{zip};

    write_members(zip, archive);

    void* buffer = nullptr;
    std::size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size)) {
      throw Zip_error("cannot finish archive: " + last_error(zip));
    }
    std::string result(static_cast<char const*>(buffer), size);
    mz_free(buffer);
    return result;
  }

  Npz_archive
  read_npz(std::filesystem::path const& path)
  {
    mz_zip_archive zip{};
    if (!mz_zip_reader_init_file(&zip, path.string().c_str(), 0)) {
      if (mz_zip_get_last_error(&zip) == MZ_ZIP_FILE_OPEN_FAILED) {
        throw std::runtime_error("npz: cannot open file: " + path.string());
      }
      throw Zip_error("not a zip archive: " + path.string() + ": " + last_error(zip));
    }
    Zip_reader_guard guard{zip};
    return read_members(zip);
  }

  void
  write_npz(std::filesystem::path const& path, Npz_archive const& archive)
  {
    mz_zip_archive zip{};
    if (!mz_zip_writer_init_file(&zip, path.string().c_str(), 0)) {
      throw std::runtime_error("npz: cannot open file: " + path.string());
    }
    Zip_writer_guard guard{zip};

    write_members(zip, archive);

    if (!mz_zip_writer_finalize_archive(&zip)) {
      throw std::runtime_error("npz: cannot write file: " + path.string() + ": " +
                               last_error(zip));
    }
  }

} // end of namespace npzkit::data::detail
