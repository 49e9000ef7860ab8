#include "merge_report.h"
#include "conflicting_merge.h"
#include <iomanip>
#include <sstream>

using namespace mergeres;

static std::string describe(const repository_ptr &repo, const commit_t &commit,
							const report_options_t &opts)
{
	ConflictingMerge merge(repo, commit, repo->load_merge(commit),
						   opts.policy_);

	//Sizes and ranks are doubles, print them without exponents
	std::ostringstream line;
	line << std::fixed << std::setprecision(0);
	line << merge.commit_id_short()
		 << "\t" << merge.conflicting_files().size()
		 << "\t" << merge.conflict_count()
		 << "\t" << merge.size();

	double rank=0;
	if (merge.locate_actual(&rank))
		line << "\t" << rank;
	else
		line << "\t-";

	if (opts.enumerate_limit_)
	{
		uint64_t seen=0;
		resolution_iterator_t iter=merge.iterator();
		resolution_merge_t candidate;
		while(seen<opts.enumerate_limit_ && iter.next(&candidate))
			++seen;
		line << "\t" << seen;
	}
	return line.str();
}

result_code_t mergeres::report_merges(const repository_ptr &repo,
	const std::vector<commit_t> &commits, const report_options_t &opts,
	std::ostream &out)
{
	VLOG_MACRO(1) << "Analyzing " << commits.size() << " merges";

	result_code_t res;
	for(auto i=commits.begin(), iend=commits.end(); i!=iend; ++i)
	{
		try
		{
			out << describe(repo, *i, opts) << std::endl;
		} catch(const mergeres_exception &ex)
		{
			LOG(ERROR) << "Merge " << i->short_id() << ": " << ex.what();
			out << i->short_id() << "\t!" << std::endl;
			res=ex.err();
		}
	}
	return res;
}
