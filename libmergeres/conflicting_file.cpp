#include "conflicting_file.h"
#include "errors.h"
#include <algorithm>

using namespace mergeres;

namespace {
	class resolution_cursor : public choice_cursor_t<resolution_file_t>
	{
		std::string path_;
		boost::shared_ptr<const std::vector<blob_t> > anchors_;
		product_iterator_t<blob_t> iter_;
	public:
		resolution_cursor(const std::string &path,
			const boost::shared_ptr<const std::vector<blob_t> > &anchors,
			const product_iterator_t<blob_t> &iter) :
			path_(path), anchors_(anchors), iter_(iter) {}

		virtual bool has_next() const
		{
			return iter_.has_next();
		}

		virtual resolution_file_t next()
		{
			std::vector<blob_t> picks;
			CHECK(iter_.next(&picks)) << "Cursor is exhausted";
			DCHECK_EQ(picks.size()+1, anchors_->size());

			//Splice the picked alternatives between the common text
			blob_t content=anchors_->front();
			for(size_t f=0; f<picks.size(); ++f)
			{
				content.append(picks[f]);
				content.append((*anchors_)[f+1]);
			}

			return resolution_file_t(path_, std::move(content));
		}
	};

	//Distinct concatenations, the left alternative varying slowest
	std::vector<blob_t> join_alternatives(const std::vector<blob_t> &left,
										  const std::vector<blob_t> &right)
	{
		std::vector<blob_t> res;
		for(auto l=left.begin(), lend=left.end(); l!=lend; ++l)
			for(auto r=right.begin(), rend=right.end(); r!=rend; ++r)
			{
				blob_t joined=*l+*r;
				if (std::find(res.begin(), res.end(), joined)==res.end())
					res.push_back(std::move(joined));
			}
		return res;
	}

	bool matches_at(const blob_t &content, size_t pos, const blob_t &text)
	{
		return content.compare(pos, text.size(), text)==0;
	}
}; //namespace

ConflictingFile::ConflictingFile(const repository_ptr &repository,
	const commit_t &commit, const std::string &path,
	const merge_result_ptr &result, const hunk_policy_ptr &policy) :
	repository_(repository), commit_(commit), path_(path), result_(result),
	conflict_count_(), anchors_(new anchors_t(1))
{
	CHECK(result_ && policy);
	if (!result_->contains_conflicts())
		err(result_code_t::sBadRequest) << path << " has no conflicts";

	const std::vector<merge_chunk_t> &chunks=result_->chunks();
	for(auto i=chunks.begin(), iend=chunks.end(); i!=iend; ++i)
	{
		if (!i->is_conflict())
		{
			anchors_->back().append(i->text_);
			continue;
		}

		++conflict_count_;
		std::vector<blob_t> alts=policy->alternatives(*i);
		if (!hunks_.empty() && anchors_->back().empty())
		{
			hunks_.back().reset(new hunk_set_t(
				join_alternatives(hunks_.back()->values(), alts)));
		} else
		{
			hunks_.push_back(hunk_set_ptr(new hunk_set_t(std::move(alts))));
			anchors_->push_back(blob_t());
		}
	}

	VLOG_MACRO(2) << path_ << ": " << conflict_count_ << " conflicts in "
				  << hunks_.size() << " hunks, policy " << policy->name();
}

void ConflictingFile::build_space(product_space_t<blob_t> *space) const
{
	for(auto i=hunks_.begin(), iend=hunks_.end(); i!=iend; ++i)
		space->connect(*i);
}

double ConflictingFile::size() const
{
	product_space_t<blob_t> space;
	build_space(&space);
	return space.size();
}

ConflictingFile::cursor_ptr ConflictingFile::produce() const
{
	product_space_t<blob_t> space;
	build_space(&space);
	return cursor_ptr(new resolution_cursor(path_, anchors_,
											space.traverse()));
}

resolution_file_t ConflictingFile::actual_resolution() const
{
	return resolution_file_t(path_, repository_->read_blob(commit_, path_));
}

/**
	Depth-first over the hunks, alternatives in candidate order, so the
	first full match is the earliest candidate. A (hunk, offset) pair
	that failed once fails again, which bounds the work by the number of
	hunks times the content length.
  */
bool ConflictingFile::match_hunks(const blob_t &content, size_t hunk,
	size_t pos, dead_ends_t *dead, std::vector<size_t> *picks) const
{
	const blob_t &anchor=(*anchors_)[hunk];
	if (!matches_at(content, pos, anchor))
		return false;
	pos+=anchor.size();

	if (hunk==hunks_.size())
		return pos==content.size();
	if (!dead->insert(std::make_pair(hunk, pos)).second)
		return false;

	const std::vector<blob_t> &alts=hunks_[hunk]->values();
	for(size_t f=0; f<alts.size(); ++f)
	{
		if (!matches_at(content, pos, alts[f]))
			continue;
		picks->push_back(f);
		if (match_hunks(content, hunk+1, pos+alts[f].size(), dead, picks))
			return true;
		picks->pop_back();
	}
	return false;
}

bool ConflictingFile::find_candidate(const resolution_file_t &file,
									 double *index) const
{
	if (file.path()!=path_)
		return false;

	std::vector<size_t> picks;
	dead_ends_t dead;
	if (!match_hunks(file.content(), 0, 0, &dead, &picks))
		return false;

	product_space_t<blob_t> space;
	build_space(&space);
	*index=space.rank(picks);
	return true;
}
