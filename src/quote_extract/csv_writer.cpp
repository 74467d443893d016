#include "csv_writer.hpp"

#include <fstream>
#include <stdexcept>


std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;

    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_strings_csv(const std::string& path, const std::vector<ExtractedRow>& rows) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open file: " + path);

    f << "doc_id,index,value\n";

    for (const auto& r : rows) {
        f << csv_field(r.doc_id) << ','
          << r.index << ','
          << csv_field(r.value) << '\n';
    }

    if (!f) throw std::runtime_error("Write failed: " + path);
}

void write_id_list(const std::string& path, const std::vector<std::string>& ids, char delim) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open file: " + path);

    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) f << delim;
        f << ids[i];
    }

    if (!f) throw std::runtime_error("Write failed: " + path);
}
