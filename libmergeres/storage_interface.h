#ifndef MERGERES_STORAGE_INTERFACE_H
#define MERGERES_STORAGE_INTERFACE_H

#include "common.h"
#include <boost/function.hpp>

namespace mergeres {

	/**
	  Raw key/value storage under a Repository. Failures of the
	  underlying store are reported as mergeres_exception(sIoError).
	  */
	class storage_t
	{
	public:
		typedef boost::function<void (const std::string &key,
									  const blob_t &val)> visitor_t;

		virtual ~storage_t() {}

		virtual bool try_get(const std::string &key, blob_t *res)=0;
		virtual void put(const std::string &key, const blob_t &val)=0;

		//Visits all keys starting with the prefix, in key order
		virtual void scan(const std::string &prefix,
						  const visitor_t &visitor)=0;
	};

	typedef boost::shared_ptr<storage_t> storage_ptr_t;

}; //namespace mergeres

#endif //MERGERES_STORAGE_INTERFACE_H
