#pragma once

#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/uri.hpp>

#include <bsoncxx/builder/basic/document.hpp>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;


#include <cstdint>
#include <string>
#include <stdexcept>
#include <vector>
#include <optional>

mongocxx::instance& mongo_instance();


struct MongoData{
    std::string id, text;
};

struct MongoSettings{
    std::string uri, db, collection, text_field;

    // MONGO_URI, MONGO_DB, MONGO_COLLECTION, MONGO_TEXT_FIELD
    static MongoSettings from_env();
};

struct MongoDB{

    explicit MongoDB(MongoSettings settings);
    MongoData get_val(std::size_t i) const;
    std::int64_t get_doc_cnt() const;
    std::size_t indexed_cnt() const { return ids.size(); }

    private:
        MongoSettings cfg;
        std::vector<bsoncxx::oid> ids;
        std::optional<mongocxx::client> mongo_client;

        mongocxx::collection collection() const;
        MongoData fetch_by_id(const bsoncxx::oid& id) const;
        void refresh_index();

};
