#ifndef MERGERES_ENGINE_H
#define MERGERES_ENGINE_H
#include "common.h"
#include "storage_interface.h"

namespace leveldb {
	class DB;
	class Status;
	typedef boost::shared_ptr<DB> db_ptr_t;
};

namespace mergeres {

	/**
	  Owns the leveldb database that keeps historical blobs and recorded
	  merge results.
	  */
	class RepoEngine
	{
		leveldb::db_ptr_t keystore_;
		bool temporary_;
		std::string filename_;

	public:
		//A temporary engine destroys its database on destruction
		MERGERES_PUBLIC RepoEngine(const std::string &filename,
								   bool temporary);
		MERGERES_PUBLIC virtual ~RepoEngine();

		MERGERES_PUBLIC storage_ptr_t create_storage(bool sync);

		const std::string& filename() const { return filename_; }

		static void check(const leveldb::Status &status);
	};

	typedef boost::shared_ptr<RepoEngine> engine_ptr;
};

#endif // MERGERES_ENGINE_H
