#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace docrev::package {

/*
  In-memory package: part name -> raw part bytes.

  Part names are zip entry names without a leading slash
  ("word/document.xml", "[Content_Types].xml"). std::map keeps the
  lexicographic order Repack relies on.
*/
using Package = std::map<std::string, std::string>;

/*
  Unpack

  Reads every file entry of a zip archive held in memory. Directory
  entries are skipped.

  Throws:
    util::NotAPackage         - bytes are not a readable zip archive
    util::MissingRequiredPart - main document or core-properties part absent
*/
Package Unpack(const std::string& bytes);

/*
  Repack

  Deterministic archive: "[Content_Types].xml" first, then every other
  part in lexicographic order, each deflated at a fixed level with a fixed
  entry timestamp. Identical input yields byte-identical output.
*/
std::string Repack(const Package& package);

// Throws util::MissingRequiredPart; run by Unpack, exposed for built packages.
void RequireParts(const Package& package);

// Whole-file wrappers; util::IOError on filesystem failures.
Package ReadPackageFile(const std::filesystem::path& path);
void    WritePackageFile(const std::filesystem::path& path, const Package& package);

} // namespace docrev::package
