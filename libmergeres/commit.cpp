#include "commit.h"
#include "errors.h"
#include <algorithm>
#include <ctype.h>

using namespace mergeres;

commit_t::commit_t(const std::string &id)
{
	if (id.size()!=40 && id.size()!=64)
		err(result_code_t::sBadRequest)
				<< "Invalid commit id length: " << id;
	if (id.find_first_not_of("0123456789abcdefABCDEF")!=std::string::npos)
		err(result_code_t::sBadRequest) << "Invalid commit id: " << id;

	id_=id;
	std::transform(id_.begin(), id_.end(), id_.begin(), ::tolower);
}

std::string commit_t::short_id() const
{
	if (id_.size()<short_length)
		throw std::out_of_range("Commit id is too short: "+id_);
	return id_.substr(0, short_length);
}
