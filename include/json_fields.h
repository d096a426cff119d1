// Optional-field readers shared by the JSON codecs. A missing key leaves the
// output untouched and succeeds; a key of the wrong type fails with a message.
#ifndef JSON_FIELDS_H
#define JSON_FIELDS_H

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

bool ReadStringField(const nlohmann::json& j, const char* key, std::string* out,
                     std::string* error);
bool ReadIntField(const nlohmann::json& j, const char* key, int* out, std::string* error);
bool ReadBoolField(const nlohmann::json& j, const char* key, bool* out, std::string* error);

bool ReadTextFile(const std::filesystem::path& path, std::string* out, std::string* error);
bool WriteTextFile(const std::filesystem::path& path, const std::string& data,
                   std::string* error);

#endif  // JSON_FIELDS_H
