#include "common.h"
#include "engine.h"
#include "errors.h"
#include "repository.h"
#include "merge_report.h"
#include <gflags/gflags.h>

#include <iostream>

using namespace mergeres;

DEFINE_string(repo_db, "", "Path to the repository store (leveldb)");
DEFINE_string(commit, "", "Merge commit to analyze, all recorded merges "
			  "if empty");
DEFINE_string(hunk_policy, "combined",
			  "Candidates per conflict region: 'sides' or 'combined'");
DEFINE_uint64(enumerate_limit, 0, "Also walk up to this many candidates "
			  "of each merge and report how many were seen");

int main(int argc, char **argv)
{
	google::InitGoogleLogging(argv[0]);
	google::SetUsageMessage("mrstat --repo_db=<path> [--commit=<id>]\n"
		"Prints: commit, files, conflicts, candidates, rank of the actual"
		" resolution ('-' if it isn't a candidate)");
	google::SetVersionString("mergeres 0.1");
	google::ParseCommandLineFlags(&argc, &argv, true);

	int res=0;
	if (FLAGS_repo_db.empty())
	{
		google::ShowUsageWithFlagsRestrict(argv[0], "mrstat");
		res=1;
	} else
	{
		try
		{
			report_options_t opts;
			opts.policy_=make_hunk_policy(FLAGS_hunk_policy);
			opts.enumerate_limit_=FLAGS_enumerate_limit;

			RepoEngine engine(FLAGS_repo_db, false);
			repository_ptr repo(new Repository(engine.create_storage(false)));

			std::vector<commit_t> commits;
			if (FLAGS_commit.empty())
				commits=repo->list_merges();
			else
				commits.push_back(commit_t(FLAGS_commit));

			//Failed merges are reported inline, the rest still run
			if (!report_merges(repo, commits, opts, std::cout).ok())
				res=2;
		} catch(const mergeres_exception &ex)
		{
			LOG(ERROR) << ex.what();
			res=ex.err().code()==result_code_t::sBadRequest ? 1 : 2;
		}
	}

	google::ShutDownCommandLineFlags();
	google::ShutdownGoogleLogging();
	return res;
}
