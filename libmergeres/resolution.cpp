#include "resolution.h"
#include <openssl/md5.h>

using namespace mergeres;

std::string resolution_file_t::compute_digest(const blob_t &content)
{
	static const char alphabet[17]="0123456789abcdef";

	unsigned char res[MD5_DIGEST_LENGTH+1]={0};
	MD5((const unsigned char*)content.data(), content.size(), res);

	std::string str_res;
	str_res.resize(MD5_DIGEST_LENGTH*2);
	for(int f=0;f<MD5_DIGEST_LENGTH;++f)
	{
		str_res[f*2]=alphabet[res[f]/16];
		str_res[f*2+1]=alphabet[res[f]%16];
	}
	return str_res;
}

resolution_file_t::resolution_file_t(const std::string &path,
									 blob_t &&content) :
	path_(path), content_(std::move(content))
{
}

resolution_file_t::resolution_file_t(const std::string &path,
									 const blob_t &content) :
	path_(path), content_(content)
{
}

const resolution_file_t* resolution_merge_t::find(
	const std::string &path) const
{
	for(auto i=files_.begin(), iend=files_.end(); i!=iend; ++i)
		if (i->path()==path)
			return &*i;
	return 0;
}
