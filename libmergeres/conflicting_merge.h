#ifndef MERGERES_CONFLICTING_MERGE_H
#define MERGERES_CONFLICTING_MERGE_H

#include "common.h"
#include "commit.h"
#include "conflicting_file.h"
#include "hunk_policy.h"
#include "merge_result.h"
#include "product_space.h"
#include "repository.h"
#include "resolution.h"

namespace mergeres {

	/**
	  Walks every candidate resolution of a merge. next() returns false
	  once the space is exhausted and leaves the output alone.
	  */
	class resolution_iterator_t
	{
		product_iterator_t<resolution_file_t> iter_;
	public:
		explicit resolution_iterator_t(
			const product_iterator_t<resolution_file_t> &iter) :
			iter_(iter) {}

		bool has_next() const { return iter_.has_next(); }

		bool next(resolution_merge_t *res)
		{
			std::vector<resolution_file_t> files;
			if (!iter_.next(&files))
				return false;
			*res=resolution_merge_t(std::move(files));
			return true;
		}

		//Candidate index within each conflicting file
		const std::vector<size_t>& indices() const { return iter_.indices(); }
	};

	/**
		A merge commit whose three-way merge conflicted. The conflicting
		files are found once, in the constructor, in path order. Every
		count or traversal builds a fresh product space over them.
	  */
	class ConflictingMerge
	{
		repository_ptr repository_;
		commit_t commit_;
		std::vector<conflicting_file_ptr> conflicting_files_;

		void build_resolutions(product_space_t<resolution_file_t> *space) const;
	public:
		MERGERES_PUBLIC ConflictingMerge(const repository_ptr &repository,
			const commit_t &commit, const merge_results_t &results,
			const hunk_policy_ptr &policy = default_hunk_policy());

		const std::vector<conflicting_file_ptr>& conflicting_files() const
		{
			return conflicting_files_;
		}

		const commit_t& commit() const { return commit_; }
		const std::string& commit_id() const { return commit_.id(); }
		std::string commit_id_short() const { return commit_.short_id(); }

		//Number of candidate resolutions, 0 without conflicts
		MERGERES_PUBLIC double size() const;
		//Number of conflict regions over all files
		MERGERES_PUBLIC uint64_t conflict_count() const;

		MERGERES_PUBLIC resolution_iterator_t iterator() const;

		/**
		  The resolution the developers actually committed. Throws
		  sNotFound or sIoError if any file can't be read, never returns
		  a partial resolution.
		  */
		MERGERES_PUBLIC resolution_merge_t actual_resolution() const;

		/**
		  Finds the actual resolution among the candidates. Returns false
		  if some file was resolved in a way the policy doesn't offer,
		  otherwise stores its position in iterator() order.
		  */
		MERGERES_PUBLIC bool locate_actual(double *rank) const;
	};

	typedef boost::shared_ptr<ConflictingMerge> conflicting_merge_ptr;
}; //namespace mergeres

#endif //MERGERES_CONFLICTING_MERGE_H
