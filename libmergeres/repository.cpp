#include "repository.h"
#include "errors.h"
#include <boost/bind/bind.hpp>
#include <string.h>

using namespace mergeres;
using namespace boost::placeholders;

Repository::Repository(const storage_ptr_t &storage) : storage_(storage)
{
	CHECK(storage_);
}

std::string Repository::make_key(const char *prefix,
	const commit_t &commit, const std::string &path)
{
	if (path.empty())
		err(result_code_t::sBadRequest) << "Empty path";

	std::string res;
	res.reserve(strlen(prefix)+commit.id().size()+path.size()+2);
	res.append(prefix).append(KEY_SEPARATOR);
	res.append(commit.id()).append(KEY_SEPARATOR);
	res.append(path);
	return res;
}

void Repository::write_blob(const commit_t &commit,
	const std::string &path, const blob_t &content)
{
	storage_->put(make_key(BLOB_PREFIX, commit, path), content);
}

bool Repository::try_read_blob(const commit_t &commit,
	const std::string &path, blob_t *res)
{
	return storage_->try_get(make_key(BLOB_PREFIX, commit, path), res);
}

blob_t Repository::read_blob(const commit_t &commit, const std::string &path)
{
	blob_t res;
	if (!try_read_blob(commit, path, &res))
		err(result_code_t::sNotFound) << "No blob for " << path
									  << " at " << commit.short_id();
	return res;
}

void Repository::record_merge(const commit_t &commit,
	const merge_results_t &results)
{
	for(auto i=results.begin(), iend=results.end(); i!=iend; ++i)
	{
		CHECK(i->second) << "Null merge result for " << i->first;
		storage_->put(make_key(MERGE_PREFIX, commit, i->first),
					  i->second->serialize());
	}
	VLOG_MACRO(2) << "Recorded " << results.size() << " merge results for "
				  << commit.short_id();
}

static void collect_merge(merge_results_t *res, size_t prefix_len,
						  const std::string &key, const blob_t &val)
{
	std::string path=key.substr(prefix_len);
	(*res)[path].reset(new merge_result_t(merge_result_t::deserialize(val)));
}

merge_results_t Repository::load_merge(const commit_t &commit)
{
	std::string prefix=std::string(MERGE_PREFIX)+KEY_SEPARATOR+
			commit.id()+KEY_SEPARATOR;

	merge_results_t res;
	storage_->scan(prefix, boost::bind(&collect_merge, &res,
									   prefix.size(), _1, _2));
	return res;
}

static void collect_commit(std::vector<commit_t> *res, size_t prefix_len,
						   const std::string &key, const blob_t &)
{
	size_t pos=key.find(KEY_SEPARATOR, prefix_len);
	if (pos==std::string::npos)
		err(result_code_t::sBadRequest) << "Malformed merge key " << key;

	commit_t commit(key.substr(prefix_len, pos-prefix_len));
	//Keys come sorted, so all paths of a commit are adjacent
	if (res->empty() || res->back()!=commit)
		res->push_back(commit);
}

std::vector<commit_t> Repository::list_merges()
{
	std::string prefix=std::string(MERGE_PREFIX)+KEY_SEPARATOR;

	std::vector<commit_t> res;
	storage_->scan(prefix, boost::bind(&collect_commit, &res,
									   prefix.size(), _1, _2));
	return res;
}
