#ifndef MERGERES_REPOSITORY_H
#define MERGERES_REPOSITORY_H

#include "common.h"
#include "commit.h"
#include "merge_result.h"
#include "storage_interface.h"

#define BLOB_PREFIX "blob"
#define MERGE_PREFIX "merge"

namespace mergeres {

	/**
		Historical content of a source tree, as far as conflict analysis
		needs it. Keys in the storage:

		  blob!<commit>!<path>   - content of a file at a commit
		  merge!<commit>!<path>  - serialized merge_result_t of a file
	  */
	class Repository
	{
		storage_ptr_t storage_;

		static std::string make_key(const char *prefix,
			const commit_t &commit, const std::string &path);
	public:
		MERGERES_PUBLIC explicit Repository(const storage_ptr_t &storage);

		MERGERES_PUBLIC void write_blob(const commit_t &commit,
			const std::string &path, const blob_t &content);
		MERGERES_PUBLIC bool try_read_blob(const commit_t &commit,
			const std::string &path, blob_t *res);
		//Throws sNotFound if there's no such blob
		MERGERES_PUBLIC blob_t read_blob(const commit_t &commit,
			const std::string &path);

		MERGERES_PUBLIC void record_merge(const commit_t &commit,
			const merge_results_t &results);
		//Empty if nothing was recorded for the commit
		MERGERES_PUBLIC merge_results_t load_merge(const commit_t &commit);
		//Commits with recorded merge results, sorted
		MERGERES_PUBLIC std::vector<commit_t> list_merges();
	};

	typedef boost::shared_ptr<Repository> repository_ptr;
}; //namespace mergeres

#endif //MERGERES_REPOSITORY_H
