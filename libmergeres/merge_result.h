#ifndef MERGERES_MERGE_RESULT_H
#define MERGERES_MERGE_RESULT_H

#include "common.h"
#include <map>

namespace mergeres {

	/**
	  A stretch of a merged file: either text both sides agree on, or
	  a conflict region with the three competing versions.
	  */
	struct merge_chunk_t
	{
		enum kind_e { COMMON = 0, CONFLICT = 1 };

		kind_e kind_;
		blob_t text_; //COMMON only
		blob_t ours_, base_, theirs_; //CONFLICT only

		bool is_conflict() const { return kind_==CONFLICT; }

		static merge_chunk_t common(const blob_t &text)
		{
			merge_chunk_t res;
			res.kind_=COMMON;
			res.text_=text;
			return res;
		}

		static merge_chunk_t conflict(const blob_t &ours,
			const blob_t &base, const blob_t &theirs)
		{
			merge_chunk_t res;
			res.kind_=CONFLICT;
			res.ours_=ours;
			res.base_=base;
			res.theirs_=theirs;
			return res;
		}

		merge_chunk_t() : kind_(COMMON) {}
	};

	MERGERES_PUBLIC bool operator == (const merge_chunk_t &l,
									  const merge_chunk_t &r);

	/**
		Result of a three-way merge of one file, as handed over by the
		merge provider: the chunks in file order.
	  */
	class merge_result_t
	{
		std::vector<merge_chunk_t> chunks_;
	public:
		merge_result_t() {}

		merge_result_t& add_common(const blob_t &text)
		{
			chunks_.push_back(merge_chunk_t::common(text));
			return *this;
		}
		merge_result_t& add_conflict(const blob_t &ours,
			const blob_t &base, const blob_t &theirs)
		{
			chunks_.push_back(merge_chunk_t::conflict(ours, base, theirs));
			return *this;
		}

		const std::vector<merge_chunk_t>& chunks() const { return chunks_; }

		MERGERES_PUBLIC bool contains_conflicts() const;
		MERGERES_PUBLIC size_t conflict_count() const;

		MERGERES_PUBLIC std::string serialize() const;
		//Throws sBadRequest on malformed input
		MERGERES_PUBLIC static merge_result_t deserialize(
			const std::string &data);
	};

	inline bool operator == (const merge_result_t &l, const merge_result_t &r)
	{
		return l.chunks() == r.chunks();
	}

	typedef boost::shared_ptr<const merge_result_t> merge_result_ptr;
	//Per-path results of one merge
	typedef std::map<std::string, merge_result_ptr> merge_results_t;
}; //namespace mergeres

#endif //MERGERES_MERGE_RESULT_H
