#ifndef TEST_COMMON_H
#define TEST_COMMON_H

#include "engine.h"
#include "errors.h"
#include "repository.h"
#include <map>
#include <stdlib.h>

#define COMMIT_A "0123456789abcdef0123456789abcdef01234567"
#define COMMIT_B "89abcdef0123456789abcdef0123456789abcdef"

//In-memory storage that can be told to fail like a broken disk
class mem_storage_t : public mergeres::storage_t
{
	std::map<std::string, mergeres::blob_t> values_;
public:
	bool fail_;

	mem_storage_t() : fail_() {}

	virtual bool try_get(const std::string &key, mergeres::blob_t *res)
	{
		check();
		auto pos=values_.find(key);
		if (pos==values_.end())
			return false;
		*res=pos->second;
		return true;
	}

	virtual void put(const std::string &key, const mergeres::blob_t &val)
	{
		check();
		values_[key]=val;
	}

	virtual void scan(const std::string &prefix, const visitor_t &visitor)
	{
		check();
		for(auto i=values_.lower_bound(prefix), iend=values_.end();
			i!=iend && i->first.compare(0, prefix.size(), prefix)==0; ++i)
			visitor(i->first, i->second);
	}

private:
	void check()
	{
		if (fail_)
			mergeres::err(mergeres::result_code_t::sIoError)
					<< "Simulated storage failure";
	}
};

//Repository in a leveldb database that is gone after the test
struct temp_repo_t
{
	std::string dir_;
	mergeres::engine_ptr engine_;
	mergeres::repository_ptr repo_;

	temp_repo_t() : dir_("/tmp/mergeres_XXXXXX")
	{
		if (!mkdtemp(&dir_[0]))
			throw std::bad_exception();
		engine_.reset(new mergeres::RepoEngine(dir_, true));
		repo_.reset(new mergeres::Repository(engine_->create_storage(false)));
	}
};

#endif //TEST_COMMON_H
