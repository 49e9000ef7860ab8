#ifndef MERGERES_HUNK_POLICY_H
#define MERGERES_HUNK_POLICY_H

#include "common.h"
#include "merge_result.h"

namespace mergeres {

	/**
	  Decides which texts a single conflict region may be resolved to.
	  Implementations must return distinct candidates in a stable order.
	  */
	class hunk_policy_t
	{
	public:
		virtual ~hunk_policy_t() {}

		virtual const char* name() const = 0;
		virtual std::vector<blob_t> alternatives(
			const merge_chunk_t &chunk) const = 0;
	};
	typedef boost::shared_ptr<const hunk_policy_t> hunk_policy_ptr;

	//Either side verbatim
	class sides_policy_t : public hunk_policy_t
	{
	public:
		virtual const char* name() const { return "sides"; }
		MERGERES_PUBLIC virtual std::vector<blob_t> alternatives(
			const merge_chunk_t &chunk) const;
	};

	//Either side, or both sides concatenated in either order
	class combined_policy_t : public hunk_policy_t
	{
	public:
		virtual const char* name() const { return "combined"; }
		MERGERES_PUBLIC virtual std::vector<blob_t> alternatives(
			const merge_chunk_t &chunk) const;
	};

	//"sides" or "combined", throws sBadRequest for anything else
	MERGERES_PUBLIC hunk_policy_ptr make_hunk_policy(const std::string &name);
	MERGERES_PUBLIC hunk_policy_ptr default_hunk_policy();
}; //namespace mergeres

#endif //MERGERES_HUNK_POLICY_H
