#ifndef MERGERES_COMMIT_H
#define MERGERES_COMMIT_H

#include "common.h"
#include <ostream>

namespace mergeres {

	/**
	  Identifier of a commit: a full SHA-1 (40) or SHA-256 (64) hex hash.
	  */
	class commit_t
	{
		std::string id_;
	public:
		static const size_t short_length = 7;

		//Throws sBadRequest for anything that isn't a full hex hash
		MERGERES_PUBLIC explicit commit_t(const std::string &id);

		const std::string& id() const { return id_; }
		MERGERES_PUBLIC std::string short_id() const;
	};

	inline bool operator == (const commit_t &l, const commit_t &r)
	{
		return l.id() == r.id();
	}
	inline bool operator != (const commit_t &l, const commit_t &r)
	{
		return !(l==r);
	}
	inline bool operator < (const commit_t &l, const commit_t &r)
	{
		return l.id() < r.id();
	}

	inline std::ostream& operator << (std::ostream& str, const commit_t &c)
	{
		return str << c.id();
	}
}; //namespace mergeres

#endif //MERGERES_COMMIT_H
