#pragma once

/**
 * RestTradeStore - trades in a PostgREST table (Supabase)
 *
 * Requests:
 *   query_existing  GET    /rest/v1/trades?select=...&user_id=eq.O&source_account=eq.A
 *   insert          POST   /rest/v1/trades            body: JSON array, 201 expected
 *   remove          DELETE /rest/v1/trades?user_id=eq.O&source_account=eq.A
 *                          Prefer: return=representation (deleted rows counted)
 *   query_sources   GET    /rest/v1/trades?select=source_account,source_broker,entry_ts
 *                          &user_id=eq.O&source_account=not.is.null
 *
 * GETs are paged with limit/offset and ordered on every selected column,
 * so rows beyond the server's max-rows cap are still returned.
 *
 * Every request carries the "apikey" header and a bearer token.
 * Non-2xx responses throw StorageError with the server's "message" field
 * (raw body when there is none); transport errors carry the curl text.
 *
 * Uses libcurl. One handle per store; not thread-safe.
 */

#include "../config/defaults.hpp"
#include "../util/string_utils.hpp"
#include "trade_json.hpp"
#include "trade_store.hpp"

#include <curl/curl.h>

#include <string>
#include <utility>
#include <vector>

namespace journal::storage {

class RestTradeStore {
public:
    RestTradeStore(std::string base_url, std::string api_key,
                   std::string table = config::store::DEFAULT_TABLE)
        : endpoint_(make_endpoint(base_url, table)), api_key_(std::move(api_key)), curl_(nullptr) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_ = curl_easy_init();
        if (!curl_) {
            curl_global_cleanup();
            throw StorageError("Failed to initialize CURL");
        }
    }

    ~RestTradeStore() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
        curl_global_cleanup();
    }

    // Non-copyable
    RestTradeStore(const RestTradeStore&) = delete;
    RestTradeStore& operator=(const RestTradeStore&) = delete;

    std::vector<StoredTrade> query_existing(const std::string& owner, const std::string& account) {
        std::string url = endpoint_ + "?select=entry_ts,ticker,side,type,qty,pnl,change" + "&user_id=eq." +
                          escape(owner) + "&source_account=eq." + escape(account) +
                          "&order=entry_ts,ticker,side,type,qty,pnl,change";

        json rows = get_all(url);
        std::vector<StoredTrade> out;
        out.reserve(rows.size());
        for (const auto& row : rows)
            out.push_back(stored_from_json(row));
        return out;
    }

    size_t insert(const std::vector<TradeRecord>& rows) {
        if (rows.empty())
            return 0;

        json body = json::array();
        for (const auto& r : rows)
            body.push_back(to_json(r));

        request("POST", endpoint_, body.dump(), {"Prefer: return=minimal"});
        return rows.size();
    }

    size_t remove(const std::string& owner, const std::string& account) {
        std::string url = endpoint_ + "?user_id=eq." + escape(owner) + "&source_account=eq." + escape(account) +
                          "&select=entry_ts";

        json deleted = parse_array(request("DELETE", url, "", {"Prefer: return=representation"}));
        return deleted.size();
    }

    std::vector<SourceRow> query_sources(const std::string& owner) {
        std::string url = endpoint_ + "?select=source_account,source_broker,entry_ts" + "&user_id=eq." +
                          escape(owner) + "&source_account=not.is.null" +
                          "&order=source_account,source_broker,entry_ts";

        json rows = get_all(url);
        std::vector<SourceRow> out;
        out.reserve(rows.size());
        for (const auto& row : rows)
            out.push_back(source_from_json(row));
        return out;
    }

    const std::string& endpoint() const { return endpoint_; }

    /**
     * "<base>/rest/v1/<table>", tolerating a trailing slash or an explicit
     * "/rest/v1" in the base URL
     */
    static std::string make_endpoint(std::string base, const std::string& table) {
        while (!base.empty() && base.back() == '/')
            base.pop_back();
        if (!util::ends_with(base, "/rest/v1"))
            base += "/rest/v1";
        return base + "/" + table;
    }

    /**
     * Message shown for a failed response: the "message" field of a JSON
     * error body, else the body itself
     */
    static std::string error_message(long http_code, const std::string& body) {
        json parsed = json::parse(body, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            auto it = parsed.find("message");
            if (it != parsed.end() && it->is_string())
                return it->get<std::string>();
        }
        if (!body.empty())
            return body;
        return "HTTP error " + std::to_string(http_code);
    }

    static std::string page_url(const std::string& url, size_t limit, size_t offset) {
        return url + "&limit=" + std::to_string(limit) + "&offset=" + std::to_string(offset);
    }

    /**
     * Concatenate every page of a GET query. Paging stops at the first
     * empty page; the offset advances by the rows actually returned, so a
     * server cap below page_size does not drop rows.
     *
     * @param fetch url -> JSON array for that page
     */
    template <typename Fetch>
    static json fetch_pages(const std::string& url, size_t page_size, Fetch&& fetch) {
        json all = json::array();
        size_t offset = 0;
        while (true) {
            json page = fetch(page_url(url, page_size, offset));
            if (page.empty())
                break;
            offset += page.size();
            for (auto& row : page)
                all.push_back(std::move(row));
        }
        return all;
    }

private:
    std::string endpoint_;
    std::string api_key_;
    CURL* curl_;

    // Owns a header list for one request
    class HeaderList {
    public:
        HeaderList() = default;
        ~HeaderList() {
            if (list_)
                curl_slist_free_all(list_);
        }
        HeaderList(const HeaderList&) = delete;
        HeaderList& operator=(const HeaderList&) = delete;

        void add(const std::string& header) {
            curl_slist* next = curl_slist_append(list_, header.c_str());
            if (!next)
                throw StorageError("Failed to build request headers");
            list_ = next;
        }
        curl_slist* get() const { return list_; }

    private:
        curl_slist* list_ = nullptr;
    };

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::string escape(const std::string& value) {
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        if (!escaped)
            throw StorageError("Failed to encode query value");
        std::string out(escaped);
        curl_free(escaped);
        return out;
    }

    json get_all(const std::string& url) {
        return fetch_pages(url, config::store::PAGE_SIZE,
                           [this](const std::string& page) { return parse_array(request("GET", page, "", {})); });
    }

    static json parse_array(const std::string& body) {
        if (body.empty())
            return json::array();
        json parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array())
            throw StorageError("Unexpected response: " + body);
        return parsed;
    }

    std::string request(const char* method, const std::string& url, const std::string& body,
                        const std::vector<std::string>& extra_headers) {
        std::string response;

        HeaderList headers;
        headers.add("apikey: " + api_key_);
        headers.add("Authorization: Bearer " + api_key_);
        headers.add("Content-Type: application/json");
        headers.add("Accept: application/json");
        for (const auto& h : extra_headers)
            headers.add(h);

        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, config::store::HTTP_TIMEOUT_SEC);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);

        // SSL options
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

        if (!body.empty()) {
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }

        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            throw StorageError(std::string("CURL error: ") + curl_easy_strerror(res));
        }

        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code < 200 || http_code >= 300) {
            throw StorageError(error_message(http_code, response));
        }

        return response;
    }
};

static_assert(TradeStore<RestTradeStore>, "RestTradeStore must satisfy TradeStore");

} // namespace journal::storage
