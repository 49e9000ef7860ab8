#ifndef MERGERES_RESOLUTION_H
#define MERGERES_RESOLUTION_H

#include "common.h"

namespace mergeres {

	/**
	  One fully resolved version of a single file.
	  */
	class resolution_file_t
	{
		std::string path_;
		blob_t content_;

	public:
		MERGERES_PUBLIC resolution_file_t(const std::string &path,
										  blob_t &&content);
		MERGERES_PUBLIC resolution_file_t(const std::string &path,
										  const blob_t &content);

		const std::string& path() const { return path_; }
		const blob_t& content() const { return content_; }
		//Hex MD5 of the content, computed on every call
		std::string digest() const { return compute_digest(content_); }

		MERGERES_PUBLIC static std::string compute_digest(
			const blob_t &content);
	};

	inline bool operator == (const resolution_file_t &l,
							 const resolution_file_t &r)
	{
		return l.path() == r.path() && l.content() == r.content();
	}
	inline bool operator != (const resolution_file_t &l,
							 const resolution_file_t &r)
	{
		return !(l==r);
	}

	/**
		A resolution of a whole merge: exactly one resolution_file_t per
		conflicting file, in the merge's file order.

		Generated candidates and the historical resolution share this
		type; nothing on the value tells them apart.
	  */
	class resolution_merge_t
	{
		typedef std::vector<resolution_file_t> files_t;
		files_t files_;
	public:
		typedef files_t::const_iterator const_iterator;

		resolution_merge_t() {}
		explicit resolution_merge_t(std::vector<resolution_file_t> &&files) :
			files_(std::move(files)) {}

		void add(const resolution_file_t &file) { files_.push_back(file); }

		size_t size() const { return files_.size(); }
		bool empty() const { return files_.empty(); }
		const std::vector<resolution_file_t>& files() const { return files_; }
		const_iterator begin() const { return files_.begin(); }
		const_iterator end() const { return files_.end(); }

		//Returns null if there's no file with this path
		MERGERES_PUBLIC const resolution_file_t* find(
			const std::string &path) const;
	};

	inline bool operator == (const resolution_merge_t &l,
							 const resolution_merge_t &r)
	{
		return l.files() == r.files();
	}
	inline bool operator != (const resolution_merge_t &l,
							 const resolution_merge_t &r)
	{
		return !(l==r);
	}
}; //namespace mergeres

#endif //MERGERES_RESOLUTION_H
