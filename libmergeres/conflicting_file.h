#ifndef MERGERES_CONFLICTING_FILE_H
#define MERGERES_CONFLICTING_FILE_H

#include "common.h"
#include "choice_set.h"
#include "hunk_policy.h"
#include "merge_result.h"
#include "product_space.h"
#include "repository.h"
#include "resolution.h"
#include <set>

namespace mergeres {

	/**
		A file whose three-way merge left conflicts. Its candidates are
		every way to pick one policy alternative per conflict region, in
		odometer order over the regions (the first region is the most
		significant digit).

		Conflict regions with no common text between them are joined into
		one hunk whose alternatives are the distinct concatenations of the
		regions' alternatives. Otherwise two different picks could splice
		to the same file and be counted twice.
	  */
	class ConflictingFile : public sized_choice_set_t<resolution_file_t>
	{
		typedef vector_choice_set_t<blob_t> hunk_set_t;
		typedef boost::shared_ptr<const hunk_set_t> hunk_set_ptr;
		typedef std::vector<blob_t> anchors_t;
		typedef std::set<std::pair<size_t, size_t> > dead_ends_t;

		repository_ptr repository_;
		commit_t commit_;
		std::string path_;
		merge_result_ptr result_;
		size_t conflict_count_;
		std::vector<hunk_set_ptr> hunks_;
		//Common text around the hunks, one more than there are hunks
		boost::shared_ptr<anchors_t> anchors_;

		void build_space(product_space_t<blob_t> *space) const;
		bool match_hunks(const blob_t &content, size_t hunk, size_t pos,
						 dead_ends_t *dead, std::vector<size_t> *picks) const;
	public:
		//Throws sBadRequest if the result has no conflicts
		MERGERES_PUBLIC ConflictingFile(const repository_ptr &repository,
			const commit_t &commit, const std::string &path,
			const merge_result_ptr &result, const hunk_policy_ptr &policy);

		const std::string& path() const { return path_; }
		const merge_result_t& merge_result() const { return *result_; }
		//Number of conflict regions in the merge result
		size_t conflict_count() const { return conflict_count_; }
		//Number of independent choices, adjacent regions count once
		size_t hunk_count() const { return hunks_.size(); }

		MERGERES_PUBLIC virtual double size() const;
		MERGERES_PUBLIC virtual cursor_ptr produce() const;

		//Content of the file in the merge commit itself. Throws
		//sNotFound/sIoError when it can't be read.
		MERGERES_PUBLIC resolution_file_t actual_resolution() const;

		/**
		  Position of the candidate equal to 'file' in produce() order,
		  false if there's none. Matches the hunks one by one against the
		  content instead of generating candidates.
		  */
		MERGERES_PUBLIC bool find_candidate(const resolution_file_t &file,
											double *index) const;
	};

	typedef boost::shared_ptr<const ConflictingFile> conflicting_file_ptr;
}; //namespace mergeres

#endif //MERGERES_CONFLICTING_FILE_H
