#ifndef MERGERES_MERGE_REPORT_H
#define MERGERES_MERGE_REPORT_H

#include "common.h"
#include "commit.h"
#include "errors.h"
#include "hunk_policy.h"
#include "repository.h"
#include <ostream>

namespace mergeres {

	struct report_options_t
	{
		hunk_policy_ptr policy_;
		//Also walk up to this many candidates per merge, 0 to skip
		uint64_t enumerate_limit_;

		report_options_t() : policy_(default_hunk_policy()),
			enumerate_limit_() {}
	};

	/**
		Writes one tab-separated line per merge:

		  short id, files, conflicts, candidates, rank of the actual
		  resolution ('-' if it isn't a candidate)[, candidates walked]

		A merge that can't be loaded or read gets "<short id>\t!" and the
		remaining merges are still reported. Returns the last failure,
		sok if there was none.
	  */
	MERGERES_PUBLIC result_code_t report_merges(const repository_ptr &repo,
		const std::vector<commit_t> &commits, const report_options_t &opts,
		std::ostream &out);
}; //namespace mergeres

#endif //MERGERES_MERGE_REPORT_H
