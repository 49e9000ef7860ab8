#include "merge_result.h"
#include "binary_stream.hpp"
#include "errors.h"

using namespace mergeres;

static const uint8_t FORMAT_VERSION=1;

bool mergeres::operator == (const merge_chunk_t &l, const merge_chunk_t &r)
{
	if (l.kind_!=r.kind_)
		return false;
	if (l.kind_==merge_chunk_t::COMMON)
		return l.text_==r.text_;
	return l.ours_==r.ours_ && l.base_==r.base_ && l.theirs_==r.theirs_;
}

bool merge_result_t::contains_conflicts() const
{
	for(auto i=chunks_.begin(), iend=chunks_.end(); i!=iend; ++i)
		if (i->is_conflict())
			return true;
	return false;
}

size_t merge_result_t::conflict_count() const
{
	size_t res=0;
	for(auto i=chunks_.begin(), iend=chunks_.end(); i!=iend; ++i)
		if (i->is_conflict())
			++res;
	return res;
}

/**
	Layout, all integers big-endian:
	[version:1][chunk count:4] then for each chunk
	  [kind:1] [len:4][text]                        - COMMON
	  [kind:1] [len:4][ours][len:4][base][len:4][theirs] - CONFLICT
  */
std::string merge_result_t::serialize() const
{
	utils::string_stream out;
	out.write_byte(FORMAT_VERSION);
	out.write_uint4(chunks_.size());
	for(auto i=chunks_.begin(), iend=chunks_.end(); i!=iend; ++i)
	{
		out.write_byte(int(i->kind_));
		if (i->is_conflict())
		{
			out.write_str(i->ours_);
			out.write_str(i->base_);
			out.write_str(i->theirs_);
		} else
			out.write_str(i->text_);
	}
	return out.buffer;
}

merge_result_t merge_result_t::deserialize(const std::string &data)
{
	merge_result_t res;
	try
	{
		utils::string_input_stream in(data);
		uint8_t version=in.read_byte();
		if (version!=FORMAT_VERSION)
			err(result_code_t::sBadRequest)
					<< "Unknown merge result format " << int(version);

		uint32_t count=in.read_uint4();
		//Every chunk takes at least five bytes
		if (count>in.remaining()/5)
			err(result_code_t::sBadRequest)
					<< "Bad chunk count " << count;
		res.chunks_.reserve(count);

		for(uint32_t f=0; f<count; ++f)
		{
			uint8_t kind=in.read_byte();
			if (kind==merge_chunk_t::COMMON)
			{
				res.chunks_.push_back(merge_chunk_t::common(in.read_str()));
			} else if (kind==merge_chunk_t::CONFLICT)
			{
				blob_t ours=in.read_str();
				blob_t base=in.read_str();
				blob_t theirs=in.read_str();
				res.chunks_.push_back(
					merge_chunk_t::conflict(ours, base, theirs));
			} else
				err(result_code_t::sBadRequest)
						<< "Unknown chunk kind " << int(kind);
		}

		if (in.remaining()!=0)
			err(result_code_t::sBadRequest)
					<< "Trailing data after merge result";
	} catch(const std::out_of_range &ex)
	{
		err(result_code_t::sBadRequest)
				<< "Truncated merge result: " << ex.what();
	}
	return res;
}
