#include "hunk_policy.h"
#include "errors.h"
#include <algorithm>

using namespace mergeres;

static void add_unique(std::vector<blob_t> &res, blob_t &&val)
{
	if (std::find(res.begin(), res.end(), val)==res.end())
		res.push_back(std::move(val));
}

std::vector<blob_t> sides_policy_t::alternatives(
	const merge_chunk_t &chunk) const
{
	DCHECK(chunk.is_conflict());
	std::vector<blob_t> res;
	res.reserve(2);
	add_unique(res, blob_t(chunk.ours_));
	add_unique(res, blob_t(chunk.theirs_));
	return res;
}

std::vector<blob_t> combined_policy_t::alternatives(
	const merge_chunk_t &chunk) const
{
	DCHECK(chunk.is_conflict());
	std::vector<blob_t> res;
	res.reserve(4);
	add_unique(res, blob_t(chunk.ours_));
	add_unique(res, blob_t(chunk.theirs_));
	add_unique(res, chunk.ours_+chunk.theirs_);
	add_unique(res, chunk.theirs_+chunk.ours_);
	return res;
}

hunk_policy_ptr mergeres::make_hunk_policy(const std::string &name)
{
	if (name=="sides")
		return hunk_policy_ptr(new sides_policy_t());
	if (name=="combined")
		return hunk_policy_ptr(new combined_policy_t());
	err(result_code_t::sBadRequest) << "Unknown hunk policy: " << name;
	return hunk_policy_ptr();
}

hunk_policy_ptr mergeres::default_hunk_policy()
{
	return make_hunk_policy("combined");
}
