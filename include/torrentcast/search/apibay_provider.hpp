#pragma once

#include "torrentcast/search/search_provider.hpp"
#include <string>

namespace torrentcast::search {

// Queries an apibay-compatible q.php endpoint over libcurl.
class ApibaySearchProvider : public SearchProvider {
public:
    explicit ApibaySearchProvider(SearchConfig config);
    
    CategoryResult fetch(const std::string& query, const std::string& category) override;
    
    // Parses the JSON array the endpoint returns. Exposed for tests.
    static CategoryResult parse_response(const std::string& body);
    
    std::string build_url(const std::string& query, const std::string& category) const;
    
private:
    SearchConfig config_;
};

}
