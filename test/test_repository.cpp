#include <boost/test/unit_test.hpp>

#include "engine.h"
#include "repository.h"
#include "test_common.h"

using namespace mergeres;

static merge_result_ptr sample_result()
{
	merge_result_t *res=new merge_result_t();
	res->add_common("head\n")
		.add_conflict("ours\n", "", "theirs\n")
		.add_common(std::string("binary\0tail\n", 12));
	return merge_result_ptr(res);
}

BOOST_AUTO_TEST_CASE(test_merge_result_encoding)
{
	merge_result_ptr res=sample_result();
	BOOST_CHECK(res->contains_conflicts());
	BOOST_CHECK_EQUAL(res->conflict_count(), 1u);

	std::string data=res->serialize();
	merge_result_t decoded=merge_result_t::deserialize(data);
	BOOST_CHECK(decoded==*res);
	BOOST_CHECK_EQUAL(decoded.chunks().at(2).text_.size(), 12u);

	merge_result_t empty;
	BOOST_CHECK(!empty.contains_conflicts());
	BOOST_CHECK(merge_result_t::deserialize(empty.serialize())==empty);
}

BOOST_AUTO_TEST_CASE(test_malformed_merge_result)
{
	std::string data=sample_result()->serialize();

	const char *names[] = { "truncated", "version", "trailing", "kind" };
	std::string broken[4] = { data.substr(0, data.size()-3), data,
							  data+"x", data };
	broken[1][0]=char(99);
	broken[3][5]=char(7); //Kind of the first chunk

	for(int f=0; f<4; ++f)
	{
		try
		{
			merge_result_t::deserialize(broken[f]);
			BOOST_ERROR(std::string("Accepted ")+names[f]+" input");
		} catch(const mergeres_exception &ex)
		{
			BOOST_CHECK_EQUAL(ex.err().code(), result_code_t::sBadRequest);
		}
	}
}

BOOST_AUTO_TEST_CASE(test_blobs)
{
	temp_repo_t tmp;
	commit_t commit(COMMIT_A);

	blob_t res;
	BOOST_CHECK(!tmp.repo_->try_read_blob(commit, "src/a.c", &res));
	try
	{
		tmp.repo_->read_blob(commit, "src/a.c");
		BOOST_FAIL("Missing blob read");
	} catch(const mergeres_exception &ex)
	{
		BOOST_CHECK_EQUAL(ex.err().code(), result_code_t::sNotFound);
	}

	tmp.repo_->write_blob(commit, "src/a.c", "int main;\n");
	BOOST_CHECK_EQUAL(tmp.repo_->read_blob(commit, "src/a.c"), "int main;\n");
	BOOST_CHECK(!tmp.repo_->try_read_blob(commit_t(COMMIT_B), "src/a.c",
										  &res));
	BOOST_CHECK_THROW(tmp.repo_->write_blob(commit, "", "x"),
					  mergeres_exception);
}

BOOST_AUTO_TEST_CASE(test_merge_records)
{
	temp_repo_t tmp;
	commit_t a(COMMIT_A), b(COMMIT_B);

	BOOST_CHECK(tmp.repo_->load_merge(a).empty());
	BOOST_CHECK(tmp.repo_->list_merges().empty());

	merge_results_t results;
	results["src/x.c"]=sample_result();
	results["src/y!weird.c"]=sample_result();
	tmp.repo_->record_merge(b, results);
	tmp.repo_->record_merge(a, results);
	//Blobs don't show up as merges
	tmp.repo_->write_blob(a, "src/x.c", "x");

	merge_results_t loaded=tmp.repo_->load_merge(a);
	BOOST_REQUIRE_EQUAL(loaded.size(), 2u);
	BOOST_REQUIRE(loaded["src/y!weird.c"]);
	BOOST_CHECK(*loaded["src/y!weird.c"]==*results["src/y!weird.c"]);

	std::vector<commit_t> merges=tmp.repo_->list_merges();
	BOOST_REQUIRE_EQUAL(merges.size(), 2u);
	BOOST_CHECK_EQUAL(merges[0], a);
	BOOST_CHECK_EQUAL(merges[1], b);
}

BOOST_AUTO_TEST_CASE(test_engine_reopen)
{
	std::string templ("/tmp/mergeres_XXXXXX");
	if (!mkdtemp(&templ[0]))
		throw std::bad_exception();

	commit_t commit(COMMIT_A);
	{
		RepoEngine engine(templ, false);
		Repository repo(engine.create_storage(true));
		repo.write_blob(commit, "kept", "still here");
	}

	{
		RepoEngine engine(templ, true);
		Repository repo(engine.create_storage(false));
		BOOST_CHECK_EQUAL(repo.read_blob(commit, "kept"), "still here");
	}
}
