#include <iostream>
#include "mongoreader.hpp"
#include "env_config.hpp"
#include "extractor.hpp"
#include "csv_writer.hpp"
#include <chrono>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>


static char delimiter_from_env() {
    std::string d = getenv_or("QUOTE_DELIMITER", std::string(1, DEFAULT_DELIMITER));
    if (d.size() != 1) {
        throw std::runtime_error("QUOTE_DELIMITER must be exactly one character, got: " + d);
    }
    return d[0];
}


int main(){
    std::vector<ExtractedRow> rows;
    std::vector<std::string> rejected;

    using clock = std::chrono::steady_clock;

    try{
        std::string export_dir  = getenv_valid("EXPORT_DIR");
        std::string strings_fn  = getenv_valid("STRINGS_FILE");
        std::string rejected_fn = getenv_valid("REJECTED_FILE");
        char delimiter = delimiter_from_env();

        MongoDB db(MongoSettings::from_env());
        size_t cnt = db.indexed_cnt();
        std::cout << "[INFO]: Docs: " << cnt << " (collection reports " << db.get_doc_cnt() << ")\n";

        auto t0 = clock::now();
        for (size_t i = 0; i < cnt; ++i){
            MongoData val = db.get_val(i);

            try {
                std::vector<std::string> strs = extract_strings(val.text, delimiter);
                for (size_t k = 0; k < strs.size(); ++k) {
                    rows.push_back({val.id, k, std::move(strs[k])});
                }
            } catch (const UnmatchedDelimiter& e) {
                std::cout << "[WARN]: " << val.id << ": " << e.what() << "\n";
                rejected.push_back(val.id);
            }

            if (i != 0 && i % 1000 == 0){
                std::chrono::duration<double> dt_tmp = clock::now() - t0;
                std::cout << std::fixed << std::setprecision(6) << "[INFO]: Time: " << dt_tmp.count()
                          << " s | Count of docs: " << i << "\n";
            }
        }
        std::chrono::duration<double> dt = clock::now() - t0;
        std::cout << std::fixed << std::setprecision(6) << "[INFO]: Program was finished after: " << dt.count() << " s\n";
        std::cout << "[INFO]: Strings: " << rows.size() << " | Rejected docs: " << rejected.size() << "\n";

        write_strings_csv(export_dir + "/" + strings_fn, rows);
        write_id_list(export_dir + "/" + rejected_fn, rejected);

    } catch (const std::exception &e){
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
