#include "common.h"
#include "engine.h"
#include "errors.h"
#include "repository.h"
#include <gflags/gflags.h>

#include <fstream>
#include <sstream>

using namespace mergeres;

DEFINE_string(repo_db, "", "Path to the repository store (leveldb)");
DEFINE_string(commit, "", "Merge commit the file belongs to");
DEFINE_string(path, "", "Path of the file inside the source tree");

static blob_t read_file(const std::string &name)
{
	std::ifstream stream(name.c_str(), std::ios::in | std::ios::binary);
	if (!stream)
		err(result_code_t::sIoError) << "Can't open " << name;
	std::ostringstream res;
	res << stream.rdbuf();
	return res.str();
}

int main(int argc, char **argv)
{
	google::InitGoogleLogging(argv[0]);
	google::SetUsageMessage("mrimport --repo_db=<path> --commit=<id> "
		"--path=<file> <actual> <ours> <base> <theirs>\n"
		"Records one conflicting file of a merge and its committed"
		" resolution");
	google::SetVersionString("mergeres 0.1");
	google::ParseCommandLineFlags(&argc, &argv, true);

	int res=0;
	if (argc!=5 || FLAGS_repo_db.empty() || FLAGS_commit.empty()
			|| FLAGS_path.empty())
	{
		google::ShowUsageWithFlagsRestrict(argv[0], "mrimport");
		res=1;
	} else
	{
		try
		{
			commit_t commit(FLAGS_commit);
			RepoEngine engine(FLAGS_repo_db, false);
			Repository repo(engine.create_storage(true));

			merge_result_t *result=new merge_result_t();
			merge_result_ptr result_ptr(result);
			result->add_conflict(read_file(argv[2]), read_file(argv[3]),
								 read_file(argv[4]));

			//Only this path is written, results recorded earlier for
			//other files of the commit stay
			merge_results_t results;
			results[FLAGS_path]=result_ptr;

			repo.write_blob(commit, FLAGS_path, read_file(argv[1]));
			repo.record_merge(commit, results);
			LOG(INFO) << "Recorded " << FLAGS_path << " at "
					  << commit.short_id();
		} catch(const mergeres_exception &ex)
		{
			LOG(ERROR) << ex.what();
			res=2;
		}
	}

	google::ShutDownCommandLineFlags();
	google::ShutdownGoogleLogging();
	return res;
}
