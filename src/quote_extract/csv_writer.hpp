#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct ExtractedRow {
    std::string doc_id;
    size_t index = 0;
    std::string value;
};

std::string csv_field(const std::string& s);

void write_strings_csv(const std::string& path, const std::vector<ExtractedRow>& rows);
void write_id_list(const std::string& path, const std::vector<std::string>& ids, char delim = '|');
