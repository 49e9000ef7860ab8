#include "conflicting_merge.h"
#include "errors.h"

using namespace mergeres;

ConflictingMerge::ConflictingMerge(const repository_ptr &repository,
	const commit_t &commit, const merge_results_t &results,
	const hunk_policy_ptr &policy) :
	repository_(repository), commit_(commit)
{
	for(auto i=results.begin(), iend=results.end(); i!=iend; ++i)
	{
		CHECK(i->second) << "Null merge result for " << i->first;
		if (!i->second->contains_conflicts())
			continue;
		conflicting_files_.push_back(conflicting_file_ptr(
			new ConflictingFile(repository_, commit_, i->first,
								i->second, policy)));
	}

	VLOG_MACRO(1) << "Merge " << commit_.short_id() << ": "
				  << conflicting_files_.size() << " of " << results.size()
				  << " files conflict";
}

void ConflictingMerge::build_resolutions(
	product_space_t<resolution_file_t> *space) const
{
	for(auto i=conflicting_files_.begin(), iend=conflicting_files_.end();
		i!=iend; ++i)
		space->connect(*i);
}

double ConflictingMerge::size() const
{
	if (conflicting_files_.empty())
		return 0;

	product_space_t<resolution_file_t> space;
	build_resolutions(&space);
	return space.size();
}

uint64_t ConflictingMerge::conflict_count() const
{
	uint64_t res=0;
	for(auto i=conflicting_files_.begin(), iend=conflicting_files_.end();
		i!=iend; ++i)
		res+=(*i)->conflict_count();
	return res;
}

resolution_iterator_t ConflictingMerge::iterator() const
{
	product_space_t<resolution_file_t> space;
	build_resolutions(&space);
	return resolution_iterator_t(space.traverse());
}

resolution_merge_t ConflictingMerge::actual_resolution() const
{
	resolution_merge_t res;
	for(auto i=conflicting_files_.begin(), iend=conflicting_files_.end();
		i!=iend; ++i)
		res.add((*i)->actual_resolution());
	return res;
}

bool ConflictingMerge::locate_actual(double *rank) const
{
	if (conflicting_files_.empty())
		return false;

	//Mixed radix over the files, like product_space_t::rank but with
	//the per-file positions kept in doubles
	double res=0;
	for(auto i=conflicting_files_.begin(), iend=conflicting_files_.end();
		i!=iend; ++i)
	{
		double index=0;
		if (!(*i)->find_candidate((*i)->actual_resolution(), &index))
		{
			VLOG_MACRO(1) << "Merge " << commit_.short_id() << ": "
						  << (*i)->path() << " resolved outside of"
						  << " the candidates";
			return false;
		}
		res=res*(*i)->size()+index;
	}

	*rank=res;
	return true;
}
