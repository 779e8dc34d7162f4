#include "record_index.hpp"

#include "recordloader.hpp"
#include "tools.hpp"
#include "worker_pool.hpp"

#include <cpppath.h>

#include <dirent.h>
#include <signal.h>
#include <sys/stat.h>

#include <algorithm>
#include <atomic>


//------------------------------------------------------------------------------
// Directory Walk

std::string GetIndexPathForContainer(const std::string& data_file_path)
{
    static const std::string container_suffix = RECORDLOADER_CONTAINER_SUFFIX;

    std::string stem = data_file_path;
    if (EndsWith(stem, container_suffix)) {
        stem.resize(stem.size() - container_suffix.size());
    }
    return stem + RECORDLOADER_INDEX_SUFFIX;
}

static bool WalkDirectory(const std::string& directory_path, std::vector<std::string>& files_out)
{
    DIR* dir = opendir(directory_path.c_str());
    if (!dir) {
        LOG_ERROR() << "Failed to open directory: " << directory_path;
        return false;
    }

    std::vector<std::string> subdirectories;

    while (struct dirent* entry = readdir(dir)) {
        const std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }

        const std::string path = cpppath::join({directory_path, name});

        struct stat sb;
        if (stat(path.c_str(), &sb) != 0) {
            LOG_WARN() << "Skipping unreadable path: " << path;
            continue;
        }

        if (S_ISDIR(sb.st_mode)) {
            subdirectories.push_back(path);
        } else if (S_ISREG(sb.st_mode) && EndsWith(name, RECORDLOADER_CONTAINER_SUFFIX)) {
            files_out.push_back(path);
        }
    }

    closedir(dir);

    for (const auto& subdirectory : subdirectories) {
        if (!WalkDirectory(subdirectory, files_out)) {
            return false;
        }
    }

    return true;
}

bool FindContainerFiles(const std::string& directory_path, std::vector<std::string>& files_out)
{
    files_out.clear();
    if (!WalkDirectory(directory_path, files_out)) {
        return false;
    }
    std::sort(files_out.begin(), files_out.end());
    return true;
}


//------------------------------------------------------------------------------
// IndexDirectory

static std::atomic<bool> m_early_stop_flag = ATOMIC_VAR_INIT(false);

bool IndexDirectory(const std::string& directory_path, int worker_count)
{
    std::vector<std::string> data_files;
    if (!FindContainerFiles(directory_path, data_files)) {
        return false;
    }

    if (data_files.empty()) {
        LOG_WARN() << "No " << RECORDLOADER_CONTAINER_SUFFIX << " files found under " << directory_path;
        return true;
    }

    WorkerPool pool;
    pool.Start(worker_count);

    std::atomic<int> files_failed(0);
    std::atomic<int> files_indexed(0);

    const uint64_t t0 = GetNsec();

    m_early_stop_flag = false;

    signal(SIGINT, [](int /*signal*/) {
        m_early_stop_flag = true;
    });

    const int num_files = (int)data_files.size();
    for (int i = 0; i < num_files && !m_early_stop_flag; ++i) {
        const std::string& data_file_path = data_files[i];
        const std::string index_file_path = GetIndexPathForContainer(data_file_path);

        const int max_active_tasks = 2;
        pool.QueueTask([t0, &files_indexed, &files_failed, num_files, data_file_path, index_file_path](int /*worker_index*/) {
            if (m_early_stop_flag) {
                return;
            }
            if (!BuildIndex(data_file_path, index_file_path)) {
                LOG_ERROR() << "Failed to index " << data_file_path;
                files_failed++;
                return;
            }
            const int count = ++files_indexed;
            if (count % 10 == 1) {
                uint64_t t1 = GetNsec();
                double seconds_elapsed = (t1 - t0) / 1000000000.0;
                double seconds_remaining = seconds_elapsed / count * (num_files - count);
                LOG_INFO() << "Indexed " << count << "/" << num_files << " files in "
                    << seconds_elapsed << " seconds (~" << seconds_remaining << " remaining)";
            }
        }, max_active_tasks);
    }

    pool.WaitForTasks();
    pool.Stop();

    signal(SIGINT, SIG_DFL);

    if (m_early_stop_flag) {
        LOG_WARN() << "Early stopping due to SIGINT after " << files_indexed << "/" << num_files << " files";
        return false;
    }

    if (files_failed > 0) {
        LOG_ERROR() << "Failed to index " << files_failed << " of " << num_files << " files";
        return false;
    }

    uint64_t t1 = GetNsec();
    double seconds_elapsed = (t1 - t0) / 1000000000.0;

    LOG_INFO() << "Indexed " << num_files << " files in " << seconds_elapsed << " seconds";
    return true;
}
