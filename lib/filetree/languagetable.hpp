#ifndef LANGUAGETABLE_HPP
#define LANGUAGETABLE_HPP

#include <filesystem>
#include <map>
#include <string>

#include "utils.hpp"

/**
 * @brief Fence language tags by lower-case file extension
 *
 * Used to tag the fenced blocks of the generated document. Unknown
 * extensions get an empty tag.
 */
inline const std::map<std::string, std::string> LanguageMap = {
    {".py", "python"},   {".js", "javascript"}, {".ts", "typescript"},
    {".json", "json"},   {".yml", "yaml"},      {".yaml", "yaml"},
    {".toml", "toml"},   {".ini", "ini"},       {".sh", "bash"},
    {".md", "markdown"}, {".html", "html"},     {".css", "css"},
    {".go", "go"},       {".rs", "rust"},       {".java", "java"},
    {".c", "c"},         {".h", "c"},           {".cpp", "cpp"},
    {".hpp", "cpp"},     {".rb", "ruby"},       {".php", "php"}};

/**
 * @brief Looks up the fence tag for a file
 *
 * @param path File path; only the extension is used, case-insensitively
 * @return std::string Language tag such as "go", or "" if unknown
 */
inline std::string languageFor(const std::filesystem::path &path) {
  auto it = LanguageMap.find(toLower(path.extension().string()));
  if (it == LanguageMap.end())
    return "";
  return it->second;
}

#endif // LANGUAGETABLE_HPP
