#include "engine.h"
#include "errors.h"

#include <leveldb/db.h>
#include <memory>

using namespace mergeres;
using namespace leveldb;

class db_storage_t : public storage_t
{
	WriteOptions wo_;
	ReadOptions ro_;
	leveldb::db_ptr_t db_;
public:
	db_storage_t(leveldb::db_ptr_t db, bool sync) : db_(db)
	{
		wo_.sync = sync;
		ro_.verify_checksums = true;
	}

	virtual bool try_get(const std::string &key, blob_t *res)
	{
		Status st = db_->Get(ro_, key, res);
		if (st.IsNotFound())
			return false;
		RepoEngine::check(st);
		return true;
	}

	virtual void put(const std::string &key, const blob_t &val)
	{
		RepoEngine::check(db_->Put(wo_, key, val));
	}

	virtual void scan(const std::string &prefix, const visitor_t &visitor)
	{
		std::unique_ptr<Iterator> iter(db_->NewIterator(ro_));
		for(iter->Seek(prefix); iter->Valid(); iter->Next())
		{
			if (!iter->key().starts_with(prefix))
				break;
			visitor(iter->key().ToString(), iter->value().ToString());
		}
		RepoEngine::check(iter->status());
	}
};

RepoEngine::RepoEngine(const std::string &filename, bool temporary)
{
	this->filename_ = filename;
	this->temporary_ = temporary;

	Options opts;
	opts.create_if_missing = true;
	opts.paranoid_checks = false;
	opts.compression = kSnappyCompression;
	opts.write_buffer_size = 8*1024*1024;

	DB *db = 0;
	leveldb::Status status = leveldb::DB::Open(opts, filename, &db);
	check(status);
	this->keystore_.reset(db);
	VLOG_MACRO(1) << "Opened repository store " << filename;
}

RepoEngine::~RepoEngine()
{
	this->keystore_.reset();
	if (temporary_)
	{
		leveldb::Status st = DestroyDB(filename_, Options());
		if (!st.ok())
			LOG(WARNING) << "Failed to destroy " << filename_ << ": "
						 << st.ToString();
	}
}

void RepoEngine::check(const leveldb::Status &status)
{
	if (status.ok())
		return;
	err(result_code_t::sIoError) << status.ToString();
}

storage_ptr_t RepoEngine::create_storage(bool sync)
{
	return storage_ptr_t(new db_storage_t(keystore_, sync));
}
