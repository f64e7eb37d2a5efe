#include "exchange/remote_page_source.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

string RemoteLocation::ToString() const {
	return StringUtil::Format("%s/%s", uri, buffer_id);
}

RemoteLocation RemoteLocation::Parse(const string &location) {
	auto scheme_end = location.find("://");
	if (scheme_end == string::npos || scheme_end == 0) {
		throw InvalidInputException("Remote location '%s' has no scheme", location);
	}
	auto path_start = location.find('/', scheme_end + 3);
	if (path_start == string::npos || path_start + 1 >= location.size()) {
		throw InvalidInputException("Remote location '%s' has no buffer id", location);
	}
	return RemoteLocation(location.substr(0, path_start), location.substr(path_start + 1));
}

} // namespace duckdb
