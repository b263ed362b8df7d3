#pragma once
#include <vector>
#include <pthread.h>
#include <sched.h>
#include <thread>
#include <string>
#include <fstream>
#include <cstdio>

#ifndef CORE_TOPOLOGY
#define CORE_TOPOLOGY ".sys_topo"
#endif

namespace util::threading {

/**
 * @brief Pins threads to logical cores following a topology file.
 *
 * The file named by CORE_TOPOLOGY lists one logical core id per line, in the
 * order cores should be handed out (e.g. all physical cores of one socket
 * before their hyperthread siblings).
 */
class ThreadPinner {
public:
    explicit ThreadPinner(const std::string& topology = CORE_TOPOLOGY) {
        loaded_ = load_topology(topology, logical_core_list);
    }

    /**
     * @brief true if the topology file was read and lists at least one core
     */
    bool ok() const noexcept {
        return loaded_;
    }

    size_t cores() const noexcept {
        return logical_core_list.size();
    }

    /**
     * @brief pins a group of threads round robin over the core list
     */
    bool pin_threads(std::vector<std::thread>& threads) const {
        if(!loaded_)
            return false;

        size_t core_len = logical_core_list.size();
        for(size_t i = 0; i < threads.size(); i++) {
            bool ok = bind_thread_to_core(
                threads[i],
                logical_core_list[i % core_len]
            );
            if(!ok)
                return false;
        }
        return true;
    }

private:
    /**
     * @brief reads the topology file into an ordered list of cores
     */
    static bool load_topology(const std::string& topo, std::vector<int>& res) {
        std::ifstream input(topo);
        std::vector<int> core_list;
        if(!input.is_open())
            return false;

        std::string line;
        int core;
        while(std::getline(input,line)) {
            if(line.empty())
                continue;
            if(std::sscanf(line.c_str(),"%d",&core) != 1 || core < 0) {
                return false;
            }
            core_list.push_back(core);
        }
        if(core_list.empty())
            return false;

        res = core_list;
        return true;
    }

    /**
     * @brief binds a thread handler to a specified core
     */
    static bool bind_thread_to_core(std::thread& t, int core_id) {
        cpu_set_t cpu_set;
        CPU_ZERO(&cpu_set);
        CPU_SET(core_id,&cpu_set);
        return pthread_setaffinity_np(t.native_handle(), sizeof(cpu_set_t), &cpu_set) == 0;
    }

    std::vector<int> logical_core_list;
    bool loaded_{false};
};

}   //namespace util::threading
