#pragma once

//
// ... Standard header files
//
#include <filesystem>
#include <string>
#include <string_view>

//
// ... npzkit header files
//
#include <npzkit/data/Npz_archive.hpp>

namespace npzkit::data::detail {

  /**
   * @brief Decode a ZIP archive held in memory.
   *
   * Stored and deflated members are accepted and their CRC-32 checksums
   * verified. Encrypted members, unsupported compression methods and
   * repeated member names throw Zip_error.
   */
  Npz_archive
  parse_zip(std::string_view bytes);

  /**
   * @brief Encode an archive as a ZIP file with every member stored
   * uncompressed, as `numpy.savez` writes it.
   */
  std::string
  format_zip(Npz_archive const& archive);

  Npz_archive
  read_npz(std::filesystem::path const& path);

  void
  write_npz(std::filesystem::path const& path, Npz_archive const& archive);

} // end of namespace npzkit::data::detail
