#pragma once

#include "api_client.hpp"
#include "cancellation.hpp"
#include "request.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace capi_pipeline {

/// One page of a list endpoint:
/// {"pagination": {"total_results", "total_pages", "next": {"href"}, ...},
///  "resources": [...]}
struct ListPage {
    int            totalResults = 0;
    int            totalPages   = 0;
    std::string    next;       // href, empty on the last page
    std::string    previous;
    nlohmann::json resources = nlohmann::json::array();

    bool hasNext() const { return !next.empty(); }

    /// Throws PipelineError(InvalidPayload) when "resources" is missing.
    static ListPage fromJson(const nlohmann::json& body);
};

/// Anything that can fetch one page of a collection.
class PageSource {
public:
    virtual ~PageSource() = default;

    virtual ListPage listPage(const CancelToken& cancel, const std::string& path,
                              const QueryParams& params) = 0;
};

/// GET through an ApiClient, so the page requests run the whole chain.
class ApiPageSource : public PageSource {
public:
    explicit ApiPageSource(ApiClient& client) : mClient(client) {}

    ListPage listPage(const CancelToken& cancel, const std::string& path,
                      const QueryParams& params) override;

private:
    ApiClient& mClient;
};

struct PaginationOptions {
    int pageSize = 50;   // per_page; <= 0 leaves the server default
    int maxPages = 0;    // 0 = no limit
};

/// Walks a collection item by item, fetching pages on demand.
class PaginationIterator {
public:
    PaginationIterator(CancelToken cancel, PageSource& source, std::string path,
                       QueryParams params = QueryParams());

    /// May fetch the next page.
    bool hasNext();

    /// Throws std::out_of_range when exhausted.
    nlohmann::json next();

    /// Every remaining item.
    std::vector<nlohmann::json> all();

    /// Calls @p fn for every remaining item; stops early when it returns
    /// false.
    void forEach(const std::function<bool(const nlohmann::json&)>& fn);

    int pagesFetched() const { return mPagesFetched; }

private:
    CancelToken   mCancel;
    PageSource&   mSource;
    std::string   mPath;
    QueryParams   mParams;

    ListPage      mPage;
    std::size_t   mIndex        = 0;
    int           mNextPage     = 1;
    int           mPagesFetched = 0;
    bool          mStarted      = false;

    void fetchPage();
};

/// Every item of the collection, honoring options.maxPages.
std::vector<nlohmann::json> fetchAllPages(const CancelToken& cancel, PageSource& source,
                                          const std::string& path,
                                          const QueryParams& params = QueryParams(),
                                          const PaginationOptions& options = PaginationOptions());

/// Hands each page to @p onPage as it arrives; returning false stops the
/// walk.  Returns the number of pages delivered.
int streamPages(const CancelToken& cancel, PageSource& source, const std::string& path,
                const QueryParams& params, const PaginationOptions& options,
                const std::function<bool(const ListPage&)>& onPage);

} // namespace capi_pipeline
