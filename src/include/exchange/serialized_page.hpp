#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/common/typedefs.hpp"

namespace duckdb {

// An opaque, already serialized block of result data produced by one remote location.
// Pages are immutable and consumed exactly once.
class SerializedPage {
public:
	explicit SerializedPage(string data_p) : data(std::move(data_p)) {
	}

	idx_t SizeInBytes() const {
		return data.size();
	}
	const string &GetData() const {
		return data;
	}

private:
	string data;
};

} // namespace duckdb
