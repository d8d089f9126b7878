#include "pagination.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace capi_pipeline {

namespace {

std::string linkHref(const nlohmann::json& pagination, const char* name) {
    if (!pagination.contains(name)) return "";
    const auto& link = pagination[name];
    if (!link.is_object() || !link.contains("href") || !link["href"].is_string()) return "";
    return link["href"].get<std::string>();
}

int countField(const nlohmann::json& pagination, const char* name) {
    auto it = pagination.find(name);
    return it != pagination.end() && it->is_number_integer() ? it->get<int>() : 0;
}

int startPage(const QueryParams& params) {
    auto it = params.find("page");
    if (it == params.end()) return 1;
    try {
        return std::max(1, std::stoi(it->second));
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid page parameter: " + it->second);
    }
}

} // namespace

ListPage ListPage::fromJson(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("resources") || !body["resources"].is_array()) {
        throw PipelineError(ErrorKind::InvalidPayload, "list response has no resources array");
    }

    ListPage page;
    page.resources = body["resources"];

    if (body.contains("pagination") && body["pagination"].is_object()) {
        const auto& p     = body["pagination"];
        page.totalResults = countField(p, "total_results");
        page.totalPages   = countField(p, "total_pages");
        page.next         = linkHref(p, "next");
        page.previous     = linkHref(p, "previous");
    }
    return page;
}

ListPage ApiPageSource::listPage(const CancelToken& cancel, const std::string& path,
                                 const QueryParams& params) {
    return ListPage::fromJson(responseJson(mClient.get(cancel, path, params)));
}

// ---------------------------------------------------------------------------
// PaginationIterator
// ---------------------------------------------------------------------------

PaginationIterator::PaginationIterator(CancelToken cancel, PageSource& source, std::string path,
                                       QueryParams params)
    : mCancel(std::move(cancel))
    , mSource(source)
    , mPath(std::move(path))
    , mParams(std::move(params))
    , mNextPage(startPage(mParams)) {}

void PaginationIterator::fetchPage() {
    mCancel.throwIfCancelled();

    QueryParams params = mParams;
    params["page"] = std::to_string(mNextPage);

    mPage  = mSource.listPage(mCancel, mPath, params);
    mIndex = 0;
    ++mNextPage;
    ++mPagesFetched;
    mStarted = true;
}

bool PaginationIterator::hasNext() {
    // Loop so that an empty intermediate page does not end the walk.
    while (true) {
        if (mStarted && mIndex < mPage.resources.size()) return true;
        if (mStarted && !mPage.hasNext()) return false;
        fetchPage();
    }
}

nlohmann::json PaginationIterator::next() {
    if (!hasNext()) {
        throw std::out_of_range("pagination exhausted");
    }
    return mPage.resources[mIndex++];
}

std::vector<nlohmann::json> PaginationIterator::all() {
    std::vector<nlohmann::json> items;
    while (hasNext()) {
        items.push_back(next());
    }
    return items;
}

void PaginationIterator::forEach(const std::function<bool(const nlohmann::json&)>& fn) {
    while (hasNext()) {
        if (!fn(next())) return;
    }
}

// ---------------------------------------------------------------------------
// Whole-collection helpers
// ---------------------------------------------------------------------------

int streamPages(const CancelToken& cancel, PageSource& source, const std::string& path,
                const QueryParams& params, const PaginationOptions& options,
                const std::function<bool(const ListPage&)>& onPage) {
    QueryParams query = params;
    if (options.pageSize > 0) {
        query["per_page"] = std::to_string(options.pageSize);
    }

    int page      = startPage(query);
    int delivered = 0;
    while (options.maxPages <= 0 || delivered < options.maxPages) {
        cancel.throwIfCancelled();
        query["page"] = std::to_string(page);

        ListPage current = source.listPage(cancel, path, query);
        ++delivered;
        if (!onPage(current) || !current.hasNext()) break;
        ++page;
    }
    return delivered;
}

std::vector<nlohmann::json> fetchAllPages(const CancelToken& cancel, PageSource& source,
                                          const std::string& path, const QueryParams& params,
                                          const PaginationOptions& options) {
    std::vector<nlohmann::json> items;
    streamPages(cancel, source, path, params, options, [&items](const ListPage& page) {
        for (const auto& resource : page.resources) {
            items.push_back(resource);
        }
        return true;
    });
    return items;
}

} // namespace capi_pipeline
