#include "mongoreader.hpp"
#include "env_config.hpp"

#include <utility>

MongoSettings MongoSettings::from_env() {
    MongoSettings s;
    s.uri        = getenv_valid("MONGO_URI");
    s.db         = getenv_valid("MONGO_DB");
    s.collection = getenv_valid("MONGO_COLLECTION");
    s.text_field = getenv_or("MONGO_TEXT_FIELD", "clean_text");
    return s;
}

mongocxx::instance& mongo_instance() {
    static mongocxx::instance inst{};
    return inst;
}

MongoDB::MongoDB(MongoSettings settings) : cfg(std::move(settings)) {
    mongo_instance();

    try {
        mongo_client.emplace(mongocxx::uri{cfg.uri});
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Mongo connect failed: ") + e.what());
    }

    refresh_index();
}

mongocxx::collection MongoDB::collection() const {
    if (!mongo_client) throw std::runtime_error("Mongo client not initialized");

    auto db = (*mongo_client)[cfg.db];
    return db[cfg.collection];
}

std::int64_t MongoDB::get_doc_cnt() const {
    auto col = collection();

    bsoncxx::builder::basic::document filter;
    return col.count_documents(filter.view());
}

void MongoDB::refresh_index() {
    ids.clear();

    try {
        auto col = collection();

        mongocxx::options::find opts;
        opts.sort(make_document(kvp("_id", 1)));
        opts.projection(make_document(kvp("_id", 1)));

        auto cursor = col.find({}, opts);
        for (auto&& doc : cursor) {
            auto e = doc["_id"];
            if (e && e.type() == bsoncxx::type::k_oid) {
                ids.push_back(e.get_oid().value);
            }
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Mongo refresh_index failed: ") + e.what());
    }
}

MongoData MongoDB::get_val(std::size_t i) const {
    if (i >= ids.size()) {
        throw std::out_of_range("MongoDB index out of range");
    }
    return fetch_by_id(ids[i]);
}


MongoData MongoDB::fetch_by_id(const bsoncxx::oid& id) const {
    auto col = collection();

    mongocxx::options::find opts;
    opts.projection(make_document(kvp(cfg.text_field, 1)));

    auto doc_opt = col.find_one(make_document(kvp("_id", id)), opts);
    if (!doc_opt) {
        throw std::runtime_error("Document not found (collection changed?): " + id.to_string());
    }

    auto v = doc_opt->view();

    MongoData out;
    out.id = id.to_string();

    // documents without the field, or with a non-string one, have no text
    auto elem = v[cfg.text_field];
    if (elem && elem.type() == bsoncxx::type::k_string) {
        out.text = std::string(elem.get_string().value);
    }

    return out;
}
