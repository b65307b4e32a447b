/*
 * This file is part of vmorch.
 * Copyright (C) 2015 RWTH Aachen University - ACS
 *
 * This file is licensed under the GNU Lesser General Public License Version 3
 * Version 3, 29 June 2007. For details see 'LICENSE.md' in the root directory.
 */

#ifndef STORAGE_BACKEND_HPP
#define STORAGE_BACKEND_HPP

#include <boost/optional.hpp>

#include <string>

/**
 * \brief An abstract class to provide an interface for disk image handling.
 *
 * All methods throw Storage_error on failure.
 */
class Storage_backend
{
public:
	/**
	 * \brief Default virtual destructor.
	 */
	virtual ~Storage_backend() = default;
	/**
	 * \brief Directory the images are stored in.
	 */
	virtual const std::string & get_storage_path() const = 0;
	/**
	 * \brief Free bytes available to unprivileged users in the storage directory.
	 */
	virtual unsigned long long free_bytes() = 0;
	/**
	 * \brief Create a new disk image.
	 *
	 * \param path The path of the new image, must not exist.
	 * \param format The image format (qcow2, raw or vmdk).
	 * \param size_gb The virtual size in GB.
	 * \param base_image Backing file of a copy-on-write image.
	 */
	virtual void create_image(const std::string &path, const std::string &format, long long size_gb,
			const boost::optional<std::string> &base_image) = 0;
	/**
	 * \brief Copy an image to a path which must not exist.
	 */
	virtual void copy_image(const std::string &source, const std::string &destination) = 0;
	virtual void remove_image(const std::string &path) = 0;
	virtual bool exists(const std::string &path) = 0;
};

/**
 * \brief Result of a command executed in a shell.
 */
struct Command_result
{
	int code = -1;
	std::string output;
};

/**
 * \brief Execute a shell command and collect exit code and combined output.
 */
Command_result exec(const std::string &cmd);

// Quote str for use as a single shell word.
std::string shell_quote(const std::string &str);

/**
 * \brief Implementation of the Storage_backend interface using qemu-img and cp on a local directory.
 */
class Image_storage :
	public Storage_backend
{
public:
	explicit Image_storage(std::string storage_path);

	const std::string & get_storage_path() const override;
	unsigned long long free_bytes() override;
	void create_image(const std::string &path, const std::string &format, long long size_gb,
			const boost::optional<std::string> &base_image) override;
	void copy_image(const std::string &source, const std::string &destination) override;
	void remove_image(const std::string &path) override;
	bool exists(const std::string &path) override;
private:
	std::string storage_path;
};

#endif
