#pragma once
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <dirent.h>
#include <sys/stat.h>

// ── rfsense runtime paths ─────────────────────────────────────────────────
// data : $HOME/.local/share/rfsense/ (persisted command)
namespace RFSensePaths {

static inline std::string home_dir(){
    const char* home=getenv("HOME");
    return home?std::string(home):std::string("/tmp");
}

static inline std::string data_dir(){
    return home_dir()+"/.local/share/rfsense";
}

static inline std::string last_command_file(){
    return data_dir()+"/last_command.json";
}

// Creates the directories if missing
static inline void ensure_dirs(){
    auto mk=[](const std::string& p){
        mkdir(p.c_str(),0755);
    };
    mk(home_dir()+"/.local");
    mk(home_dir()+"/.local/share");
    mk(data_dir());
}

// Sensor identity: MAC of the first wireless interface (wlan*/wlp*),
// else of the first non-loopback interface, else "".
static inline std::string interface_mac(){
    DIR* d=opendir("/sys/class/net");
    if(!d) return "";
    std::string wifi, other;
    struct dirent* e;
    while((e=readdir(d))!=nullptr){
        if(e->d_name[0]=='.' || strcmp(e->d_name,"lo")==0) continue;
        char path[512];
        snprintf(path,sizeof(path),"/sys/class/net/%s/address",e->d_name);
        FILE* f=fopen(path,"r");
        if(!f) continue;
        char mac[64]={};
        bool ok=fgets(mac,sizeof(mac),f)!=nullptr;
        fclose(f);
        if(!ok) continue;
        mac[strcspn(mac,"\r\n")]='\0';
        if(!mac[0] || strcmp(mac,"00:00:00:00:00:00")==0) continue;
        bool is_wifi=strncmp(e->d_name,"wlan",4)==0 || strncmp(e->d_name,"wlp",3)==0;
        if(is_wifi && wifi.empty()) wifi=mac;
        else if(!is_wifi && other.empty()) other=mac;
    }
    closedir(d);
    return !wifi.empty()?wifi:other;
}

// Writes to path.tmp then renames over path
static inline bool atomic_write(const std::string& path, const std::string& data){
    std::string tmp=path+".tmp";
    FILE* f=fopen(tmp.c_str(),"wb");
    if(!f) return false;
    bool ok=fwrite(data.data(),1,data.size(),f)==data.size();
    ok = (fflush(f)==0) && ok;
    ok = (fsync(fileno(f))==0) && ok;
    ok = (fclose(f)==0) && ok;
    if(!ok){ remove(tmp.c_str()); return false; }
    if(rename(tmp.c_str(),path.c_str())!=0){ remove(tmp.c_str()); return false; }
    return true;
}

static inline bool read_file(const std::string& path, std::string& out){
    FILE* f=fopen(path.c_str(),"rb");
    if(!f) return false;
    out.clear();
    char buf[4096]; size_t n;
    while((n=fread(buf,1,sizeof(buf),f))>0) out.append(buf,n);
    bool ok=!ferror(f);
    fclose(f);
    return ok;
}

} // namespace RFSensePaths
